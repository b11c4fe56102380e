#include <multirender/math/bez_path.hpp>
#include <fmt/format.h>
#include <cctype>
#include <charconv>
#include <iterator>

namespace multirender {

std::string BezPath::ToSvg() const {
  std::string svg{};
  auto out = std::back_inserter(svg);

  for(const PathElement& element : m_elements) {
    if(!svg.empty()) {
      svg.push_back(' ');
    }

    const auto& p = element.points;
    switch(element.kind) {
      case PathElement::Kind::MoveTo:  fmt::format_to(out, "M{} {}", p[0].x, p[0].y); break;
      case PathElement::Kind::LineTo:  fmt::format_to(out, "L{} {}", p[0].x, p[0].y); break;
      case PathElement::Kind::QuadTo:  fmt::format_to(out, "Q{} {} {} {}", p[0].x, p[0].y, p[1].x, p[1].y); break;
      case PathElement::Kind::CurveTo: fmt::format_to(out, "C{} {} {} {} {} {}", p[0].x, p[0].y, p[1].x, p[1].y, p[2].x, p[2].y); break;
      case PathElement::Kind::ClosePath: svg.push_back('Z'); break;
    }
  }

  return svg;
}

namespace {

class SvgPathLexer {
  public:
    explicit SvgPathLexer(std::string_view svg) : m_svg{svg} {}

    void SkipSeparators() {
      while(m_position < m_svg.size() && (std::isspace((unsigned char)m_svg[m_position]) || m_svg[m_position] == ',')) {
        m_position++;
      }
    }

    [[nodiscard]] bool AtEnd() {
      SkipSeparators();
      return m_position >= m_svg.size();
    }

    /// @returns true if the next token is a number (rather than a command letter)
    [[nodiscard]] bool NextIsNumber() {
      SkipSeparators();
      if(m_position >= m_svg.size()) {
        return false;
      }
      const char c = m_svg[m_position];
      return std::isdigit((unsigned char)c) || c == '-' || c == '+' || c == '.';
    }

    std::optional<char> ReadCommand() {
      SkipSeparators();
      if(m_position >= m_svg.size() || !std::isalpha((unsigned char)m_svg[m_position])) {
        return std::nullopt;
      }
      return m_svg[m_position++];
    }

    std::optional<f64> ReadNumber() {
      SkipSeparators();
      if(m_position < m_svg.size() && m_svg[m_position] == '+') {
        m_position++;
      }

      const char* begin = m_svg.data() + m_position;
      const char* end = m_svg.data() + m_svg.size();
      f64 value{};
      const auto [ptr, ec] = std::from_chars(begin, end, value);
      if(ec != std::errc{} || ptr == begin) {
        return std::nullopt;
      }
      m_position += (size_t)(ptr - begin);
      return value;
    }

    std::optional<Point> ReadPoint() {
      const std::optional<f64> x = ReadNumber();
      if(!x.has_value()) {
        return std::nullopt;
      }
      const std::optional<f64> y = ReadNumber();
      if(!y.has_value()) {
        return std::nullopt;
      }
      return Point{*x, *y};
    }

  private:
    std::string_view m_svg;
    size_t m_position{0u};
};

} // anonymous namespace

std::optional<BezPath> BezPath::FromSvg(std::string_view svg) {
  SvgPathLexer lexer{svg};
  BezPath path{};
  Point current_point{};
  Point start_point{};
  char command = '\0';

  while(!lexer.AtEnd()) {
    if(!lexer.NextIsNumber()) {
      const std::optional<char> next_command = lexer.ReadCommand();
      if(!next_command.has_value()) {
        return std::nullopt;
      }
      command = *next_command;
    } else if(command == '\0' || command == 'Z' || command == 'z') {
      // Coordinates without a preceding command.
      return std::nullopt;
    }

    const bool relative = std::islower((unsigned char)command);
    const Vec2 origin = relative ? current_point.ToVec2() : Vec2{};

    switch(std::toupper((unsigned char)command)) {
      case 'M': {
        const std::optional<Point> p = lexer.ReadPoint();
        if(!p.has_value()) return std::nullopt;
        current_point = *p + origin;
        start_point = current_point;
        path.MoveTo(current_point);
        // Subsequent coordinate pairs are implicit line-to commands.
        command = relative ? 'l' : 'L';
        break;
      }
      case 'L': {
        const std::optional<Point> p = lexer.ReadPoint();
        if(!p.has_value()) return std::nullopt;
        current_point = *p + origin;
        path.LineTo(current_point);
        break;
      }
      case 'H': {
        const std::optional<f64> x = lexer.ReadNumber();
        if(!x.has_value()) return std::nullopt;
        current_point = {*x + origin.x, current_point.y};
        path.LineTo(current_point);
        break;
      }
      case 'V': {
        const std::optional<f64> y = lexer.ReadNumber();
        if(!y.has_value()) return std::nullopt;
        current_point = {current_point.x, *y + origin.y};
        path.LineTo(current_point);
        break;
      }
      case 'Q': {
        const std::optional<Point> p1 = lexer.ReadPoint();
        const std::optional<Point> p2 = p1 ? lexer.ReadPoint() : std::nullopt;
        if(!p2.has_value()) return std::nullopt;
        current_point = *p2 + origin;
        path.QuadTo(*p1 + origin, current_point);
        break;
      }
      case 'C': {
        const std::optional<Point> p1 = lexer.ReadPoint();
        const std::optional<Point> p2 = p1 ? lexer.ReadPoint() : std::nullopt;
        const std::optional<Point> p3 = p2 ? lexer.ReadPoint() : std::nullopt;
        if(!p3.has_value()) return std::nullopt;
        current_point = *p3 + origin;
        path.CurveTo(*p1 + origin, *p2 + origin, current_point);
        break;
      }
      case 'Z': {
        path.ClosePath();
        current_point = start_point;
        break;
      }
      default: {
        return std::nullopt;
      }
    }
  }

  return path;
}

} // namespace multirender
