#include "orb-assets/src/Geometry.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace orb_assets
{

Mesh::Mesh(MeshData data,
           uint32_t baseVertex,
           uint32_t bufferOffset,
           const Eigen::Vector3d& center)
  : vertices_{std::move(data.vertices)},
    indices_{std::move(data.indices)},
    baseVertex_{baseVertex},
    bufferOffset_{bufferOffset},
    center_{center}
{
  for (auto& index : indices_)
  {
    if (index >= vertices_.size())
    {
      throw std::invalid_argument("Mesh index " + std::to_string(index) +
                                  " out of range for " +
                                  std::to_string(vertices_.size()) +
                                  " vertices");
    }
    index += baseVertex_;
  }
}

void Mesh::moveTo(const Eigen::Vector3d& newCenter)
{
  Eigen::Vector3d const delta = newCenter - center_;

  auto const dx = static_cast<float>(delta.x());
  auto const dy = static_cast<float>(delta.y());
  auto const dz = static_cast<float>(delta.z());

  for (auto& vertex : vertices_)
  {
    vertex.position[0] += dx;
    vertex.position[1] += dy;
    vertex.position[2] += dz;
  }

  center_ = newCenter;
}

size_t MeshBuffer::append(MeshData data, const Eigen::Vector3d& center)
{
  auto const vertexCount = static_cast<uint32_t>(data.vertices.size());
  auto const indexCount = static_cast<uint32_t>(data.indices.size());

  meshes_.emplace_back(std::move(data), vertexCount_, indexCount_, center);

  vertexCount_ += vertexCount;
  indexCount_ += indexCount;

  return meshes_.size() - 1;
}

std::vector<Vertex> MeshBuffer::flattenVertices() const
{
  std::vector<Vertex> result;
  result.reserve(vertexCount_);

  for (const auto& mesh : meshes_)
  {
    result.insert(
      result.end(), mesh.getVertices().begin(), mesh.getVertices().end());
  }

  return result;
}

std::vector<uint32_t> MeshBuffer::flattenIndices() const
{
  std::vector<uint32_t> result;
  result.reserve(indexCount_);

  for (const auto& mesh : meshes_)
  {
    result.insert(
      result.end(), mesh.getIndices().begin(), mesh.getIndices().end());
  }

  return result;
}

}  // namespace orb_assets
