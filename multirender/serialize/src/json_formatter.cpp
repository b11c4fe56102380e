#include <multirender/serialize/json_formatter.hpp>

namespace multirender {

namespace {

class DepthLimitedFormatter {
  public:
    explicit DepthLimitedFormatter(size_t max_depth) : m_max_depth{max_depth} {}

    void Write(const nlohmann::ordered_json& value, size_t depth) {
      if(value.is_object()) {
        WriteContainer(value, depth, '{', '}');
      } else if(value.is_array()) {
        WriteContainer(value, depth, '[', ']');
      } else {
        m_output += value.dump();
      }
    }

    [[nodiscard]] std::string TakeOutput() {
      return std::move(m_output);
    }

  private:
    void WriteContainer(const nlohmann::ordered_json& container, size_t depth, char open, char close) {
      const size_t inner_depth = depth + 1u;
      const bool pretty = inner_depth <= m_max_depth;
      bool first = true;

      m_output += open;

      for(auto it = container.begin(); it != container.end(); ++it) {
        if(pretty) {
          if(!first) {
            m_output += ',';
          }
          m_output += '\n';
          Indent(inner_depth);
        } else if(!first) {
          m_output += ", ";
        }
        first = false;

        if(container.is_object()) {
          m_output += nlohmann::ordered_json(it.key()).dump();
          m_output += ": ";
        }
        Write(it.value(), inner_depth);
      }

      if(pretty && !first) {
        m_output += '\n';
        Indent(depth);
      }

      m_output += close;
    }

    void Indent(size_t depth) {
      m_output.append(depth * 2u, ' ');
    }

    size_t m_max_depth;
    std::string m_output{};
};

} // anonymous namespace

std::string dump_json_depth_limited(const nlohmann::ordered_json& value, size_t max_depth) {
  DepthLimitedFormatter formatter{max_depth};
  formatter.Write(value, 0u);
  return formatter.TakeOutput();
}

} // namespace multirender
