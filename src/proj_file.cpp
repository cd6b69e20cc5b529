#include "proj_file.h"

#include "errors.h"
#include "util.h"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <vector>

namespace dotres {

namespace {

constexpr std::size_t kPropertyGroupDepth{ 2 };
constexpr std::size_t kAssemblyNameDepth{ 3 };

class xml_scanner {
 public:
  explicit xml_scanner(std::string_view xml) : xml_{ xml } {
    if (xml_.starts_with("\xEF\xBB\xBF")) { pos_ = 3; }  // UTF-8 BOM
  }

  std::string assembly_name() {
    bool saw_root{ false };

    while (pos_ < xml_.size()) {
      if (xml_[pos_] != '<') {
        auto const text{ read_text() };
        if (stack_.empty()) {
          if (!util_trim(text).empty()) { fail("text outside of root element"); }
        } else if (in_assembly_name()) {
          current_.append(text);
        }
        continue;
      }

      if (starts_with("<?")) {
        skip_past("?>", "unterminated processing instruction");
      } else if (starts_with("<!--")) {
        skip_past("-->", "unterminated comment");
      } else if (starts_with("<![CDATA[")) {
        pos_ += 9;
        auto const end{ xml_.find("]]>", pos_) };
        if (end == std::string_view::npos) { fail("unterminated CDATA section"); }
        if (stack_.empty()) { fail("CDATA outside of root element"); }
        if (in_assembly_name()) { current_.append(xml_.substr(pos_, end - pos_)); }
        pos_ = end + 3;
      } else if (starts_with("<!")) {
        skip_past(">", "unterminated declaration");
      } else if (starts_with("</")) {
        close_element();
        if (stack_.empty()) { return result_; }  // anything after the root is ignored
      } else {
        if (stack_.empty() && saw_root) { fail("multiple root elements"); }
        saw_root = true;
        if (open_element()) {
          if (stack_.empty()) { return result_; }  // <Project/>
        }
      }
    }

    if (!saw_root) { fail("no root element"); }
    fail("unexpected end of document inside <" + stack_.back() + ">");
  }

 private:
  [[noreturn]] void fail(std::string const &what) const {
    throw malformed_descriptor_error("malformed project file: " + what + " (offset " +
                                     std::to_string(pos_) + ")");
  }

  bool starts_with(std::string_view prefix) const {
    return xml_.substr(pos_, prefix.size()) == prefix;
  }

  void skip_past(std::string_view terminator, char const *error) {
    auto const end{ xml_.find(terminator, pos_) };
    if (end == std::string_view::npos) { fail(error); }
    pos_ = end + terminator.size();
  }

  bool in_assembly_name() const {
    return stack_.size() == kAssemblyNameDepth && stack_[1] == "PropertyGroup" &&
           stack_[2] == "AssemblyName";
  }

  // Bytes of multi-byte UTF-8 sequences are accepted so non-ASCII names pass.
  static bool is_name_char(char c) {
    auto const u{ static_cast<unsigned char>(c) };
    return u >= 0x80 || std::isalnum(u) || c == '_' || c == '-' || c == '.' || c == ':';
  }

  void skip_whitespace() {
    while (pos_ < xml_.size() && std::isspace(static_cast<unsigned char>(xml_[pos_]))) {
      ++pos_;
    }
  }

  std::string read_name() {
    size_t const start{ pos_ };
    while (pos_ < xml_.size() && is_name_char(xml_[pos_])) { ++pos_; }
    if (pos_ == start) { fail("expected a name"); }
    auto name{ xml_.substr(start, pos_ - start) };
    if (auto const colon{ name.rfind(':') }; colon != std::string_view::npos) {
      name.remove_prefix(colon + 1);  // namespace prefixes are not significant here
    }
    return std::string{ name };
  }

  // Returns true for a self-closing element.
  bool open_element() {
    ++pos_;  // '<'
    auto name{ read_name() };

    for (;;) {
      skip_whitespace();
      if (pos_ >= xml_.size()) { fail("unterminated start tag <" + name + ">"); }
      if (xml_[pos_] == '>') {
        ++pos_;
        stack_.push_back(std::move(name));
        if (in_assembly_name()) { current_.clear(); }
        return false;
      }
      if (starts_with("/>")) {
        pos_ += 2;
        if (name == "AssemblyName" && stack_.size() == kPropertyGroupDepth &&
            stack_[1] == "PropertyGroup") {
          result_.clear();
        }
        return true;
      }

      read_name();
      skip_whitespace();
      if (pos_ >= xml_.size() || xml_[pos_] != '=') { fail("attribute without value"); }
      ++pos_;
      skip_whitespace();
      if (pos_ >= xml_.size() || (xml_[pos_] != '"' && xml_[pos_] != '\'')) {
        fail("unquoted attribute value");
      }
      char const quote{ xml_[pos_] };
      auto const end{ xml_.find(quote, pos_ + 1) };
      if (end == std::string_view::npos) { fail("unterminated attribute value"); }
      pos_ = end + 1;
    }
  }

  void close_element() {
    pos_ += 2;  // "</"
    auto const name{ read_name() };
    skip_whitespace();
    if (pos_ >= xml_.size() || xml_[pos_] != '>') { fail("unterminated end tag"); }
    ++pos_;

    if (stack_.empty() || stack_.back() != name) {
      fail("unexpected end tag </" + name + ">");
    }
    if (in_assembly_name()) { result_ = std::string{ util_trim(current_) }; }
    stack_.pop_back();
  }

  std::string read_text() {
    std::string text;
    while (pos_ < xml_.size() && xml_[pos_] != '<') {
      if (xml_[pos_] == '&') {
        text.append(read_entity());
      } else {
        text.push_back(xml_[pos_++]);
      }
    }
    return text;
  }

  std::string read_entity() {
    auto const end{ xml_.find(';', pos_) };
    if (end == std::string_view::npos) { fail("unterminated entity"); }
    auto const entity{ xml_.substr(pos_ + 1, end - pos_ - 1) };
    pos_ = end + 1;

    if (entity == "lt") { return "<"; }
    if (entity == "gt") { return ">"; }
    if (entity == "amp") { return "&"; }
    if (entity == "quot") { return "\""; }
    if (entity == "apos") { return "'"; }

    if (entity.size() > 1 && entity[0] == '#') {
      bool const hex{ entity[1] == 'x' || entity[1] == 'X' };
      auto const digits{ entity.substr(hex ? 2 : 1) };
      std::uint32_t cp{ 0 };
      auto const [ptr, ec]{
        std::from_chars(digits.data(), digits.data() + digits.size(), cp, hex ? 16 : 10)
      };
      if (ec == std::errc{} && ptr == digits.data() + digits.size() && !digits.empty()) {
        return encode_utf8(cp);
      }
    }

    fail("unknown entity &" + std::string{ entity } + ";");
  }

  std::string encode_utf8(std::uint32_t cp) const {
    std::string out;
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      fail("character reference out of range");
    }
    return out;
  }

  std::string_view xml_;
  size_t pos_{ 0 };
  std::vector<std::string> stack_;
  std::string current_;
  std::string result_;
};

}  // namespace

std::string proj_file_parse_assembly_name(std::string_view xml) {
  return xml_scanner{ xml }.assembly_name();
}

std::string proj_file_assembly_name(std::filesystem::path const &path) {
  auto const content{ util_load_file(path) };
  try {
    return proj_file_parse_assembly_name(content);
  } catch (malformed_descriptor_error const &e) {
    throw malformed_descriptor_error(path.string() + ": " + e.what());
  }
}

}  // namespace dotres
