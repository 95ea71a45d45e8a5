#ifndef ORB_SIM_VEC3_FORMATTER_BASE_HPP
#define ORB_SIM_VEC3_FORMATTER_BASE_HPP

#include <format>
#include <string>

namespace orb_sim::detail
{

/// Shared std::formatter base for the Vec3DBase types.
/// Accepts [width][.precision][type] and prints "(x, y, z)".
template <typename T>
struct Vec3FormatterBase
{
  char presentation = 'f';
  int precision = 6;
  int width = 0;

  constexpr auto parse(std::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    auto end = ctx.end();

    if (it == end || *it == '}')
    {
      return it;
    }

    if (*it >= '0' && *it <= '9')
    {
      width = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        width = width * 10 + (*it - '0');
        ++it;
      }
    }

    if (it != end && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }

    if (it != end && (*it == 'f' || *it == 'e' || *it == 'g'))
    {
      presentation = *it;
      ++it;
    }

    return it;
  }

  auto format(const T& vec, std::format_context& ctx) const
  {
    const std::string componentFmt = buildComponentFormat();
    const double x = vec.x();
    const double y = vec.y();
    const double z = vec.z();
    return std::format_to(ctx.out(),
                          "({}, {}, {})",
                          std::vformat(componentFmt, std::make_format_args(x)),
                          std::vformat(componentFmt, std::make_format_args(y)),
                          std::vformat(componentFmt, std::make_format_args(z)));
  }

private:
  std::string buildComponentFormat() const
  {
    std::string componentFmt = "{:";
    if (width > 0)
    {
      componentFmt += std::to_string(width);
    }
    componentFmt += '.';
    componentFmt += std::to_string(precision);
    componentFmt += presentation;
    componentFmt += '}';
    return componentFmt;
  }
};

}  // namespace orb_sim::detail

#endif  // ORB_SIM_VEC3_FORMATTER_BASE_HPP
