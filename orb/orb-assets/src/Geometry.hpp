#ifndef ORB_ASSETS_GEOMETRY_HPP
#define ORB_ASSETS_GEOMETRY_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace orb_assets
{

struct Vertex
{
  float position[3];  // Position (x, y, z)
  float color[4];     // Color (r, g, b, a)
  float normal[3];    // Normal vector (x, y, z)
};

/**
 * @brief Linear RGBA color, each channel in [0, 1]
 */
struct Color
{
  float r{1.0f};
  float g{1.0f};
  float b{1.0f};
  float a{1.0f};
};

inline constexpr Color kWhite{1.0f, 1.0f, 1.0f, 1.0f};
inline constexpr Color kYellow{1.0f, 1.0f, 0.0f, 1.0f};
inline constexpr Color kRed{1.0f, 0.0f, 0.0f, 1.0f};

/**
 * @brief Output of the procedural generators
 *
 * Indices are 0-based and local to this vertex list; every three form one
 * triangle.
 */
struct MeshData
{
  std::vector<Vertex> vertices;
  std::vector<uint32_t> indices;
};

/**
 * @brief Renderable mesh placed in a shared vertex/index buffer
 *
 * Indices are stored globally offset: local index + baseVertex, so they can
 * be drawn straight out of the shared buffer. The mesh draws the index range
 * [bufferOffset, bufferOffset + indices.size()).
 *
 * The cached center is kept in double precision and is the reference point
 * used to compute the next incremental displacement.
 */
class Mesh
{
public:
  /**
   * @brief Place generated mesh data into a shared buffer
   * @param data Vertices and local indices
   * @param baseVertex First vertex slot in the shared vertex buffer
   * @param bufferOffset First slot in the shared index buffer
   * @param center Point the geometry was generated around
   * @throws std::invalid_argument if an index is outside the vertex list
   */
  Mesh(MeshData data,
       uint32_t baseVertex,
       uint32_t bufferOffset,
       const Eigen::Vector3d& center);

  const std::vector<Vertex>& getVertices() const
  {
    return vertices_;
  }

  const std::vector<uint32_t>& getIndices() const
  {
    return indices_;
  }

  [[nodiscard]] uint32_t getBaseVertex() const
  {
    return baseVertex_;
  }

  [[nodiscard]] uint32_t getBufferOffset() const
  {
    return bufferOffset_;
  }

  const Eigen::Vector3d& getCenter() const
  {
    return center_;
  }

  /**
   * @brief Rigidly move the mesh so its center lands on newCenter
   *
   * Every vertex position is shifted by (newCenter - center) and the cached
   * center becomes newCenter. Colors and normals are unchanged.
   */
  void moveTo(const Eigen::Vector3d& newCenter);

  Mesh(const Mesh&) = default;
  Mesh& operator=(const Mesh&) = default;
  Mesh(Mesh&&) noexcept = default;
  Mesh& operator=(Mesh&&) noexcept = default;
  ~Mesh() = default;

private:
  std::vector<Vertex> vertices_;
  std::vector<uint32_t> indices_;
  uint32_t baseVertex_;
  uint32_t bufferOffset_;
  Eigen::Vector3d center_;
};

/**
 * @brief Ordered meshes sharing one vertex buffer and one index buffer
 *
 * Offsets come from explicit running counters: the n-th appended mesh
 * starts where the (n-1)-th ended, so index ranges never overlap.
 */
class MeshBuffer
{
public:
  MeshBuffer() = default;

  /**
   * @brief Append a mesh at the current end of both buffers
   * @return Index of the new mesh within this buffer
   */
  size_t append(MeshData data, const Eigen::Vector3d& center);

  std::vector<Mesh>& getMeshes()
  {
    return meshes_;
  }

  const std::vector<Mesh>& getMeshes() const
  {
    return meshes_;
  }

  [[nodiscard]] size_t size() const
  {
    return meshes_.size();
  }

  [[nodiscard]] uint32_t getVertexCount() const
  {
    return vertexCount_;
  }

  [[nodiscard]] uint32_t getIndexCount() const
  {
    return indexCount_;
  }

  /**
   * @brief Concatenated vertices of all meshes, ready for upload
   */
  std::vector<Vertex> flattenVertices() const;

  /**
   * @brief Concatenated global indices of all meshes, ready for upload
   */
  std::vector<uint32_t> flattenIndices() const;

private:
  std::vector<Mesh> meshes_;
  uint32_t vertexCount_{0};
  uint32_t indexCount_{0};
};

}  // namespace orb_assets

#endif  // ORB_ASSETS_GEOMETRY_HPP
