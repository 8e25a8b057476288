#include "utils.hh"

namespace confl {
  using namespace trieste;

  size_t counter = 0;

  Node err(const NodeRange& r, const std::string& msg) {
    return Error << (ErrorMsg ^ msg) << (ErrorAst << r);
  }

  Node err(Node node, const std::string& msg) {
    return Error << (ErrorMsg ^ msg) << (ErrorAst << node);
  }

  std::string node_val(Node node) {
    std::string text(node->location().view());
    return text;
  }

  std::string unquote(Node node) {
    std::string_view text = node->location().view();
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
      text = text.substr(1, text.size() - 2);
    }

    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
      char c = text[i];
      if (c != '\\' || i + 1 == text.size()) {
        result.push_back(c);
        continue;
      }

      c = text[++i];
      switch (c) {
        case 'n':
          result.push_back('\n');
          break;
        case 't':
          result.push_back('\t');
          break;
        case 'r':
          result.push_back('\r');
          break;
        default:
          result.push_back(c);
          break;
      }
    }
    return result;
  }

  std::string fresh_var() {
    return "%" + std::to_string(counter++);
  }

  bool is_fresh_var(std::string_view name) {
    return !name.empty() && name.front() == '%';
  }

  void reset_fresh_vars() {
    counter = 0;
  }
}
