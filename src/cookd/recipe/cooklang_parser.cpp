#include "cookd/recipe/cooklang_parser.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "cookd/scan/element_locator.hpp"
#include "cookd/scan/scan_primitives.hpp"
#include "cookd/text/utf8.hpp"
#include "cookd/utils/string_utils.hpp"

namespace cookd::recipe {

namespace {

using scan::ElementExtent;
using scan::kNoOffset;
using scan::LineEndOf;
using scan::Trim;

auto NextLineStart(std::string_view text, std::size_t line_end)
    -> std::size_t {
  if (line_end >= text.size()) {
    return text.size();
  }
  if (text[line_end] == '\r' && line_end + 1 < text.size() &&
      text[line_end + 1] == '\n') {
    return line_end + 2;
  }
  return line_end + 1;
}

auto IsDelimiterLine(std::string_view line) -> bool {
  auto trimmed = Trim(line);
  return trimmed.size() >= 3 &&
         trimmed.find_first_not_of('-') == std::string_view::npos;
}

auto ParseQuantity(std::string_view group) -> std::optional<Quantity> {
  auto body = Trim(group);
  if (body.empty()) {
    return std::nullopt;
  }
  auto percent = body.find('%');
  if (percent == std::string_view::npos) {
    return Quantity{.value = std::string(body), .unit = std::nullopt};
  }
  auto unit = Trim(body.substr(percent + 1));
  return Quantity{
      .value = std::string(Trim(body.substr(0, percent))),
      .unit = unit.empty() ? std::nullopt
                           : std::optional<std::string>(std::string(unit))};
}

// Mutable state of one Parse() call.
class ParseSession {
 public:
  explicit ParseSession(std::string_view text) : text_(text) {
  }

  auto Run(std::shared_ptr<spdlog::logger> logger) -> ParseResult {
    auto invalid = text::FirstInvalidByte(text_);
    if (invalid < text_.size()) {
      result_.errors.push_back(
          {.severity = Severity::kError,
           .message = "Recipe is not valid UTF-8",
           .span = SourceSpan{.start = invalid, .end = invalid + 1}});
      return std::move(result_);
    }

    auto body_start = ParseFrontMatter(logger);
    if (!body_start) {
      return std::move(result_);
    }

    ParseBody(*body_start);
    result_.recipe = std::move(recipe_);
    return std::move(result_);
  }

 private:
  // Returns where the body starts, or nullopt when the front matter is fatal.
  auto ParseFrontMatter(const std::shared_ptr<spdlog::logger>& logger)
      -> std::optional<std::size_t> {
    auto first_end = LineEndOf(text_, 0);
    if (!IsDelimiterLine(text_.substr(0, first_end))) {
      return 0;
    }

    auto yaml_start = NextLineStart(text_, first_end);
    auto pos = yaml_start;
    while (pos < text_.size()) {
      auto line_end = LineEndOf(text_, pos);
      if (IsDelimiterLine(text_.substr(pos, line_end - pos))) {
        auto yaml_text = text_.substr(yaml_start, pos - yaml_start);
        if (!LoadYaml(yaml_text, yaml_start, pos, logger)) {
          return std::nullopt;
        }
        return NextLineStart(text_, line_end);
      }
      pos = NextLineStart(text_, line_end);
    }

    // No closing delimiter: the dashes are ordinary text.
    AddWarning(
        "Front matter is not closed with '---'",
        SourceSpan{.start = 0, .end = first_end});
    return 0;
  }

  auto LoadYaml(
      std::string_view yaml_text, std::size_t block_start,
      std::size_t block_end, const std::shared_ptr<spdlog::logger>& logger)
      -> bool {
    try {
      auto yaml = YAML::Load(std::string(yaml_text));
      if (!yaml || yaml.IsNull()) {
        return true;
      }
      if (!yaml.IsMap()) {
        result_.errors.push_back(
            {.severity = Severity::kError,
             .message = "Front matter must be a YAML mapping",
             .span = SourceSpan{.start = block_start, .end = block_end}});
        return false;
      }

      for (const auto& entry : yaml) {
        auto key = entry.first.as<std::string>();
        auto value = entry.second.IsScalar()
                         ? entry.second.as<std::string>()
                         : YAML::Dump(entry.second);
        auto mark = entry.first.Mark();
        auto start = mark.is_null()
                         ? block_start
                         : block_start + static_cast<std::size_t>(mark.pos);
        AddMetadata(
            std::move(key), std::move(value),
            SourceSpan{.start = start, .end = LineEndOf(text_, start)});
      }
      return true;
    } catch (const YAML::Exception& e) {
      logger->debug("CooklangParser front matter error: {}", e.what());
      auto start = block_start;
      if (!e.mark.is_null() && e.mark.pos >= 0) {
        start = std::min(
            block_start + static_cast<std::size_t>(e.mark.pos), block_end);
      }
      result_.errors.push_back(
          {.severity = Severity::kError,
           .message = fmt::format("Invalid YAML front matter: {}", e.msg),
           .span = SourceSpan{
               .start = start,
               .end = std::max(start, LineEndOf(text_, start))}});
      return false;
    }
  }

  void ParseBody(std::size_t pos) {
    while (pos < text_.size()) {
      auto line_end = LineEndOf(text_, pos);
      auto line = text_.substr(pos, line_end - pos);

      if (Trim(line).empty()) {
        FlushStep();
        pos = NextLineStart(text_, line_end);
        continue;
      }
      if (line.starts_with(">>")) {
        ParseMetadataLine(pos, line_end);
        pos = NextLineStart(text_, line_end);
        continue;
      }
      if (scan::IsSectionLine(line)) {
        StartSection(pos, line_end);
        pos = NextLineStart(text_, line_end);
        continue;
      }
      if (line.starts_with("--")) {
        pos = NextLineStart(text_, line_end);
        continue;
      }
      pos = ParseStepLine(pos, line_end);
    }
    FlushStep();
    CloseSection();
  }

  void ParseMetadataLine(std::size_t start, std::size_t end) {
    auto body = text_.substr(start + 2, end - start - 2);
    SourceSpan span{.start = start, .end = end};
    auto colon = body.find(':');
    if (colon == std::string_view::npos) {
      AddWarning("Metadata line is missing ':'", span);
      return;
    }
    auto key = Trim(body.substr(0, colon));
    if (key.empty()) {
      AddWarning("Metadata key is empty", span);
      return;
    }
    AddMetadata(
        std::string(key), std::string(Trim(body.substr(colon + 1))), span);
  }

  void AddMetadata(std::string key, std::string value, SourceSpan span) {
    auto folded = utils::ToLower(key);
    if (!metadata_keys_.insert(folded).second) {
      AddWarning(fmt::format("Duplicate metadata key '{}'", key), span);
    }
    recipe_.metadata.push_back(
        {.key = std::move(key), .value = std::move(value), .span = span});
  }

  void StartSection(std::size_t start, std::size_t end) {
    FlushStep();
    CloseSection();
    auto name = scan::SectionName(text_.substr(start, end - start));
    current_section_ = Section{
        .name = name.empty() ? std::nullopt
                             : std::optional<std::string>(std::string(name)),
        .steps = {},
        .span = SourceSpan{.start = start, .end = end}};
  }

  void CloseSection() {
    if (!current_section_) {
      return;
    }
    // The implicit leading section only exists when it holds steps.
    if (current_section_->name || !current_section_->steps.empty() ||
        current_section_->span.end > current_section_->span.start) {
      recipe_.sections.push_back(std::move(*current_section_));
    }
    current_section_.reset();
  }

  // Parses one text line (longer when an element spans lines) and returns
  // the start of the next unparsed line.
  auto ParseStepLine(std::size_t start, std::size_t line_end) -> std::size_t {
    auto content_end = line_end;
    auto pos = start;
    while (auto element = scan::NextInlineElement(text_, pos, content_end)) {
      auto element_end = element->end;
      if (element->kind != scan::ElementKind::kComment) {
        auto extent =
            ClipToLine(scan::ScanElementExtent(text_, element->start));
        AddElement(extent);
        element_end = extent.end;
      }
      pos = std::max(element_end, element->start + 1);
      if (pos > content_end) {
        content_end = LineEndOf(text_, pos);
      }
    }

    auto line_text = Trim(text_.substr(start, content_end - start));
    if (!step_) {
      step_ = Step{
          .text = std::string(line_text),
          .span = SourceSpan{.start = start, .end = content_end}};
    } else {
      step_->text += ' ';
      step_->text += line_text;
      step_->span.end = content_end;
    }
    return NextLineStart(text_, content_end);
  }

  void FlushStep() {
    if (!step_) {
      return;
    }
    if (!current_section_) {
      current_section_ = Section{
          .name = std::nullopt,
          .steps = {},
          .span = SourceSpan{.start = step_->span.start,
                             .end = step_->span.start}};
    }
    current_section_->span.end =
        std::max(current_section_->span.end, step_->span.end);
    current_section_->steps.push_back(std::move(*step_));
    step_.reset();
  }

  // A brace group closed on a later line is reported as unclosed, so that
  // the elements on the following lines are still parsed.
  auto ClipToLine(ElementExtent extent) const -> ElementExtent {
    auto line_end = LineEndOf(text_, extent.marker);
    if (extent.IsClosed() && extent.brace_close > line_end) {
      extent.brace_close = kNoOffset;
      extent.note_open = kNoOffset;
      extent.note_close = kNoOffset;
      extent.end = line_end;
    }
    return extent;
  }

  void AddElement(const ElementExtent& extent) {
    auto marker = scan::MarkerKindOf(text_[extent.marker]);
    if (!marker) {
      return;
    }
    auto kind_name = scan::ToString(scan::ToElementKind(*marker));
    SourceSpan span{.start = extent.marker, .end = extent.end};

    if (extent.HasBraces() && !extent.IsClosed()) {
      AddError(fmt::format("Unclosed '{{' in {}", kind_name), span);
      return;
    }

    auto name = scan::ElementName(text_, extent);
    std::optional<Quantity> quantity;
    if (extent.IsClosed()) {
      quantity = ParseQuantity(text_.substr(
          extent.brace_open + 1, extent.brace_close - extent.brace_open - 1));
      if (quantity && quantity->value.empty() && quantity->unit) {
        AddWarning(
            fmt::format("Unit '{}' has no quantity", *quantity->unit), span);
      }
    }

    std::optional<std::string> note;
    if (extent.note_open != kNoOffset) {
      auto body = Trim(text_.substr(
          extent.note_open + 1, extent.note_close - extent.note_open - 1));
      if (!body.empty()) {
        note = std::string(body);
      }
    }

    switch (*marker) {
      case scan::MarkerKind::kIngredient:
        if (name.empty()) {
          AddError("Ingredient name is empty", span);
          return;
        }
        AddNamed(
            recipe_.ingredients,
            Ingredient{
                .name = std::string(name),
                .quantity = std::move(quantity),
                .note = std::move(note),
                .span = span,
                .references = {}});
        break;
      case scan::MarkerKind::kCookware:
        if (name.empty()) {
          AddError("Cookware name is empty", span);
          return;
        }
        AddNamed(
            recipe_.cookware,
            Cookware{
                .name = std::string(name),
                .quantity = std::move(quantity),
                .note = std::move(note),
                .span = span,
                .references = {}});
        break;
      case scan::MarkerKind::kTimer:
        if (name.empty() && !quantity) {
          AddError("Timer has neither a name nor a duration", span);
          return;
        }
        recipe_.timers.push_back(Timer{
            .name = name.empty()
                        ? std::nullopt
                        : std::optional<std::string>(std::string(name)),
            .quantity = std::move(quantity),
            .span = span});
        break;
    }
  }

  template <typename T>
  static void AddNamed(std::vector<T>& items, T item) {
    auto it = std::ranges::find_if(items, [&item](const T& existing) {
      return utils::EqualsIgnoreCase(existing.name, item.name);
    });
    if (it == items.end()) {
      items.push_back(std::move(item));
      return;
    }
    it->references.push_back(item.span);
    if (!it->quantity && item.quantity) {
      it->quantity = std::move(item.quantity);
    }
  }

  void AddError(std::string message, SourceSpan span) {
    result_.errors.push_back(
        {.severity = Severity::kError,
         .message = std::move(message),
         .span = span});
  }

  void AddWarning(std::string message, SourceSpan span) {
    result_.warnings.push_back(
        {.severity = Severity::kWarning,
         .message = std::move(message),
         .span = span});
  }

  std::string_view text_;
  ParseResult result_;
  Recipe recipe_;
  std::optional<Section> current_section_;
  std::optional<Step> step_;
  std::unordered_set<std::string> metadata_keys_;
};

}  // namespace

CooklangParser::CooklangParser(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto CooklangParser::Parse(std::string_view text) const -> ParseResult {
  ParseSession session(text);
  auto result = session.Run(logger_);
  logger_->trace(
      "CooklangParser parsed {} bytes: {} errors, {} warnings", text.size(),
      result.errors.size(), result.warnings.size());
  return result;
}

}  // namespace cookd::recipe
