#include "markdown.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>

Link MarkdownExporter::parse_target(const std::string &target) {
  size_t colon = target.find(':');
  if (colon == std::string::npos || colon == 0) {
    return {"", target};
  }
  return {target.substr(0, colon), target.substr(colon + 1)};
}

std::string MarkdownExporter::convert_heading(const std::string &line) {
  size_t level = 0;
  while (level < line.size() && line[level] == '*') {
    level++;
  }

  if (level == 0 || level >= line.size() || line[level] != ' ') {
    return line;
  }

  return std::string(level, '#') + line.substr(level);
}

std::string MarkdownExporter::rewrite_links(const std::string &line,
                                            const LinkRenderer &link_hook) {
  std::string result;
  size_t pos = 0;

  while (pos < line.size()) {
    size_t open = line.find("[[", pos);
    if (open == std::string::npos) {
      break;
    }

    size_t close = line.find("]]", open + 2);
    if (close == std::string::npos) {
      break;
    }

    std::string inner = line.substr(open + 2, close - open - 2);
    std::string target = inner;
    std::optional<std::string> label;

    size_t split = inner.find("][");
    if (split != std::string::npos) {
      target = inner.substr(0, split);
      label = inner.substr(split + 2);
    }

    result += line.substr(pos, open - pos);
    if (target.empty()) {
      result += line.substr(open, close + 2 - open);
    } else {
      result += link_hook(parse_target(target), label);
    }
    pos = close + 2;
  }

  result += line.substr(std::min(pos, line.size()));
  return result;
}

std::string MarkdownExporter::from_org(const std::string &body,
                                       const LinkRenderer &link_hook) {
  std::istringstream stream(body);
  std::ostringstream out;
  std::string line;
  bool in_block = false;

  while (std::getline(stream, line)) {
    std::string lower = line;
    for (auto &c : lower) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (!in_block && lower.rfind("#+begin_src", 0) == 0) {
      in_block = true;
      std::string lang = line.size() > 11 ? line.substr(12) : "";
      out << "```" << lang.substr(0, lang.find(' ')) << "\n";
      continue;
    }
    if (in_block) {
      if (lower.rfind("#+end_src", 0) == 0) {
        in_block = false;
        out << "```\n";
      } else {
        out << line << "\n";
      }
      continue;
    }

    out << rewrite_links(convert_heading(line), link_hook) << "\n";
  }

  return out.str();
}
