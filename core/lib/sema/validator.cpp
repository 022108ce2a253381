// eligian/sema/validator.cpp - Semantic validation rules
//
#include "eligian/sema/validator.hpp"

#include <algorithm>
#include <array>
#include <fmt/core.h>
#include <map>
#include <regex>
#include <set>
#include <unordered_set>

#include "eligian/basic/string_distance.hpp"
#include "eligian/registry/css_parser.hpp"

namespace eligian
{

namespace
{

constexpr std::array<std::string_view, 16> k_reserved_keywords = {
  "action", "as",     "at",       "break",    "continue", "else",      "false", "for",
  "from",   "if",     "import",   "layout",   "provider", "styles",    "timeline", "true",
};

constexpr size_t k_listed_names = 5;

bool is_reserved_keyword(std::string_view name)
{
  return std::find(k_reserved_keywords.begin(), k_reserved_keywords.end(), name) !=
         k_reserved_keywords.end();
}

std::string reserved_keyword_list()
{
  std::string out;
  for (const auto kw : k_reserved_keywords) {
    if (!out.empty()) out += ", ";
    out += kw;
  }
  return out;
}

/// "a, b, c, d, e, ..." with at most k_listed_names entries
std::string list_names(const std::vector<std::string> & names)
{
  std::string out;
  for (size_t i = 0; i < names.size() && i < k_listed_names; ++i) {
    if (i > 0) out += ", ";
    out += names[i];
  }
  if (names.size() > k_listed_names) out += ", ...";
  return out;
}

std::string join(const std::vector<std::string> & names)
{
  std::string out;
  for (const auto & n : names) {
    if (!out.empty()) out += ", ";
    out += n;
  }
  return out;
}

/// "Did you mean 'x'?" or the list of known names
std::string suggestion_hint(
  const std::string & name, const std::vector<std::string> & known, std::string_view what)
{
  if (auto nearest = nearest_match(name, known)) {
    return fmt::format("Did you mean '{}'?", *nearest);
  }
  if (known.empty()) {
    return fmt::format("No {} are defined in the imported files", what);
  }
  return fmt::format("Available {}: {}", what, list_names(known));
}

std::string seconds(double value) { return fmt::format("{}s", value); }

/// Runtime references are resolved by the engine, not checked here
bool is_runtime_reference(const std::string & value) { return !value.empty() && value[0] == '$'; }

bool is_relative_path(const std::string & path)
{
  return path.rfind("./", 0) == 0 || path.rfind("../", 0) == 0;
}

const std::regex & language_code_pattern()
{
  static const std::regex pattern("^[a-z]{2}-[A-Z]{2}$");
  return pattern;
}

const std::regex & container_selector_pattern()
{
  static const std::regex pattern(R"(^[#.\w\-:\[\]]+$)");
  return pattern;
}

}  // namespace

// ============================================================================
// Entry point
// ============================================================================

DiagnosticBag Validator::validate(const ir::ConfigIR & config) const
{
  DiagnosticBag diags;

  check_imports(diags);
  check_languages(config, diags);

  for (const auto & timeline : config.timelines) {
    check_timeline(timeline, diags);
    check_timing(timeline, diags);
  }

  for (const auto & action : config.actions) {
    check_operations(config, action.start_operations, diags);
    check_operations(config, action.end_operations, diags);
  }
  for (const auto & timeline : config.timelines) {
    for (const auto & action : timeline.actions) {
      check_operations(config, action.operations, diags);
      check_operations(config, action.end_operations, diags);
    }
  }

  return diags;
}

// ============================================================================
// Imports
// ============================================================================

void Validator::check_imports(DiagnosticBag & diags) const
{
  const auto & refs = imports_.imports();

  // One default import per category
  std::set<ImportCategory> seen_categories;
  for (const auto & ref : refs) {
    if (ref.kind != ImportKind::Default || !ref.category) continue;
    if (!seen_categories.insert(*ref.category).second) {
      diags
        .report_error(
          ref.range, fmt::format(
                       "Duplicate '{}' import, only one {} import is allowed", ref.name, ref.name))
        .with_code("DUPLICATE_DEFAULT_IMPORT")
        .with_help(fmt::format("Remove duplicate {} import statements", ref.name));
    }
  }

  std::unordered_set<std::string> seen_names;
  for (const auto & ref : refs) {
    if (ref.kind != ImportKind::Named) continue;
    if (!seen_names.insert(ref.name).second) {
      diags
        .report_error(
          ref.range,
          fmt::format("Duplicate import name '{}', import names must be unique", ref.name))
        .with_code("DUPLICATE_IMPORT_NAME")
        .with_help("Choose a different name for this import");
    }
  }

  for (const auto & ref : refs) {
    if (ref.kind == ImportKind::Named && is_reserved_keyword(ref.name)) {
      diags
        .report_error(ref.range, fmt::format("Cannot use reserved keyword '{}' as import name", ref.name))
        .with_code("RESERVED_KEYWORD")
        .with_help("Reserved keywords: " + reserved_keyword_list());
    }
  }

  for (const auto & ref : refs) {
    if (ref.kind == ImportKind::Named && catalog_.contains(ref.name)) {
      diags
        .report_error(ref.range, fmt::format("Cannot use operation name '{}' as import name", ref.name))
        .with_code("OPERATION_NAME_CONFLICT")
        .with_help(fmt::format("'{}' is a built-in operation. Choose a different import name", ref.name));
    }
  }

  for (const auto & ref : refs) {
    if (!is_relative_path(ref.path)) {
      diags
        .report_error(
          ref.range,
          "Import path must be relative (start with './' or '../'), absolute paths are not portable")
        .with_code("ABSOLUTE_PATH")
        .with_help("Use './filename.ext' or '../folder/filename.ext' for relative paths");
    }
  }

  for (const auto & ref : refs) {
    if (ref.kind != ImportKind::Named || ref.explicit_type) continue;
    const std::string ext = file_extension(ref.path);
    switch (classify_extension(ref.path)) {
      case ExtensionType::Ambiguous:
        diags
          .report_error(
            ref.range, fmt::format("Ambiguous file extension '.{}', please specify type explicitly", ext))
          .with_code("AMBIGUOUS_EXTENSION")
          .with_help("Add 'as media' to clarify this is a media file");
        break;
      case ExtensionType::Unknown:
        diags
          .report_error(
            ref.range, fmt::format(
                         "Unknown file extension '.{}', please specify type: import {} from '{}' as "
                         "html|css|media",
                         ext, ref.name, ref.path))
          .with_code("UNKNOWN_EXTENSION")
          .with_help("Add 'as html', 'as css', or 'as media' to specify the asset type");
        break;
      default:
        break;
    }
  }
}

// ============================================================================
// Languages
// ============================================================================

void Validator::check_languages(const ir::ConfigIR & config, DiagnosticBag & diags) const
{
  const auto & langs = config.available_languages;
  if (langs.empty()) return;

  std::unordered_set<std::string> seen;
  for (const auto & lang : langs) {
    if (!seen.insert(lang.code).second) {
      diags.report_error(lang.range, fmt::format("Duplicate language code '{}'", lang.code))
        .with_code("DUPLICATE_LANGUAGE")
        .with_help("Each language may appear only once in the languages block");
    }
  }

  const auto default_count =
    std::count_if(langs.begin(), langs.end(), [](const auto & l) { return l.is_default; });
  if (langs.size() > 1 && default_count == 0) {
    diags.report_error(langs.front().range, "No default language in the languages block")
      .with_code("MISSING_DEFAULT_LANGUAGE")
      .with_help(fmt::format("Mark the default language with '*', e.g. * \"{}\"", langs.front().code));
  }

  bool default_seen = false;
  for (const auto & lang : langs) {
    if (!lang.is_default) continue;
    if (default_seen) {
      diags
        .report_error(lang.range, fmt::format("Language '{}' is marked as default, but a default is already set", lang.code))
        .with_code("MULTIPLE_DEFAULT_LANGUAGES")
        .with_help("Mark exactly one language with '*'");
    }
    default_seen = true;
  }

  for (const auto & lang : langs) {
    if (!std::regex_match(lang.code, language_code_pattern())) {
      diags.report_error(lang.range, fmt::format("Invalid language code '{}'", lang.code))
        .with_code("INVALID_LANGUAGE_CODE")
        .with_help("Use the language-REGION format, e.g. 'en-US' or 'nl-NL'");
    }
  }

  // Only meaningful when the document's locale files were loaded
  if (registries_.document_imports(imports_.document_uri()).locale_files.empty()) return;
  const auto locale_languages = registries_.locale_languages_for(imports_.document_uri());
  for (const auto & lang : langs) {
    if (std::find(locale_languages.begin(), locale_languages.end(), lang.code) ==
        locale_languages.end()) {
      diags
        .report_warning(lang.range, fmt::format("Language '{}' has no translations in the imported locale files", lang.code))
        .with_code("LANGUAGE_NOT_IN_LOCALES")
        .with_help(fmt::format(
          "Add a '{}' section to the locale file, or remove it from the languages block",
          lang.code));
    }
  }
}

// ============================================================================
// Timelines
// ============================================================================

void Validator::check_timeline(const ir::Timeline & timeline, DiagnosticBag & diags) const
{
  const bool media = timeline.provider == TimelineProvider::Video ||
                     timeline.provider == TimelineProvider::Audio;
  const std::string provider(to_string(timeline.provider));

  if (media && !timeline.source) {
    diags
      .report_error(
        timeline.range,
        fmt::format("Timeline provider '{}' requires a source file", provider))
      .with_code("MISSING_TIMELINE_SOURCE")
      .with_help(fmt::format("Add: using {} from \"./file\"", provider));
  }

  if (!media && timeline.source) {
    diags
      .report_warning(
        timeline.range,
        fmt::format("Timeline provider '{}' does not use a source file", provider))
      .with_code("UNUSED_TIMELINE_SOURCE")
      .with_help("Remove the source, or use the video or audio provider");
  }

  if (timeline.actions.empty()) {
    diags.report_warning(timeline.range, fmt::format("Timeline '{}' has no events", timeline.name))
      .with_code("EMPTY_TIMELINE")
      .with_help("Add at least one event, e.g. at 0s..1s [ ... ] [ ... ]");
  }

  if (!std::regex_match(timeline.container_selector, container_selector_pattern())) {
    diags
      .report_error(
        timeline.range, fmt::format("Invalid container selector '{}'", timeline.container_selector))
      .with_code("INVALID_CONTAINER_SELECTOR")
      .with_help("Use a single id, class or element selector such as '#app'");
  } else {
    check_selector(timeline.container_selector, timeline.range, diags);
  }
}

void Validator::check_timing(const ir::Timeline & timeline, DiagnosticBag & diags) const
{
  for (const auto & action : timeline.actions) {
    const auto & d = action.duration;

    switch (action.origin) {
      case ir::ActionOrigin::Timed:
        if (d.start < 0) {
          diags
            .report_error(
              action.range,
              fmt::format("Timeline event start time cannot be negative (got {})", seconds(d.start)))
            .with_code("TIMING_NEGATIVE_START")
            .with_help("Start times must be 0s or later");
        }
        if (!(d.end > d.start)) {
          diags
            .report_error(action.range, "Timeline event end time must be greater than start time")
            .with_code("TIMING_END_BEFORE_START")
            .with_help(fmt::format(
              "The event runs from {} to {}; make the end time later than the start time",
              seconds(d.start), seconds(d.end)));
        }
        break;

      case ir::ActionOrigin::SequenceStep:
        if (action.declared_duration && !(*action.declared_duration > 0)) {
          diags.report_error(action.range, "Sequence item duration must be positive")
            .with_code("SEQUENCE_DURATION")
            .with_help(fmt::format(
              "Give '{}' a duration greater than 0s (got {})", action.name,
              seconds(*action.declared_duration)));
        }
        break;

      case ir::ActionOrigin::StaggerItem:
        // Checked once per block below
        break;
    }
  }

  // Blocks with no items produce no actions but are still checked
  for (const auto & group : timeline.stagger_groups) {
    if (!(group.delay > 0)) {
      diags.report_error(group.range, "Stagger delay must be greater than 0")
        .with_code("STAGGER_DELAY")
        .with_help(fmt::format("Use a positive delay such as 100ms (got {})", seconds(group.delay)));
    }
    if (!(group.duration > 0)) {
      diags.report_error(group.range, "Stagger duration must be positive")
        .with_code("STAGGER_DURATION")
        .with_help(fmt::format(
          "Give each staggered item a duration greater than 0s (got {})", seconds(group.duration)));
    }
  }
}

// ============================================================================
// Operations
// ============================================================================

void Validator::check_operations(
  const ir::ConfigIR & config, const std::vector<ir::Operation> & ops, DiagnosticBag & diags) const
{
  for (const auto & op : ops) {
    if (const auto * raw = std::get_if<ir::RawOperation>(&op)) {
      check_raw_operation(config, *raw, diags);
    } else {
      check_action_call(config, std::get<ir::ActionCall>(op), diags);
    }
  }
}

void Validator::check_raw_operation(
  const ir::ConfigIR & config, const ir::RawOperation & op, DiagnosticBag & diags) const
{
  const OperationSignature * sig = catalog_.find(op.system_name);
  if (sig == nullptr) {
    std::vector<std::string> candidates = catalog_.names();
    for (const auto & action : config.actions) {
      candidates.push_back(action.name);
    }
    const auto suggestions = similar_names(op.system_name, candidates, 3);
    diags.report_error(op.range, fmt::format("Unknown operation: \"{}\"", op.system_name))
      .with_code("UNKNOWN_OPERATION")
      .with_help(
        suggestions.empty() ? "Available operations: " + list_names(catalog_.names())
                            : "Did you mean: " + join(suggestions) + "?");
    return;
  }

  const size_t required = sig->required_count();
  const size_t total = sig->total_count();
  const size_t got = op.args.size();
  if (got < required || got > total) {
    const std::string expected =
      required == total ? std::to_string(total) : fmt::format("{}-{}", required, total);
    diags
      .report_error(
        op.range, fmt::format(
                    "Operation \"{}\" expects {} parameter(s), but got {}", op.system_name,
                    expected, got))
      .with_code("PARAMETER_COUNT")
      .with_help("Expected: " + sig->format_usage());
  }

  for (size_t i = 0; i < op.args.size(); ++i) {
    const auto & arg = op.args[i];
    const OperationParam * param = arg.name ? sig->find_param(*arg.name) : sig->param_at(i);
    if (param == nullptr || !arg.value.is_string()) continue;

    const auto & text = arg.value.get_ref<const std::string &>();
    if (is_runtime_reference(text)) continue;

    const SourceRange range = arg.range.is_valid() ? arg.range : op.range;
    switch (param->type) {
      case ParamType::Selector:
        check_selector(text, range, diags);
        break;
      case ParamType::ClassName:
        check_class_name(text, range, diags);
        break;
      case ParamType::LabelId:
        check_label(text, range, diags);
        break;
      default:
        break;
    }
  }
}

void Validator::check_action_call(
  const ir::ConfigIR & config, const ir::ActionCall & call, DiagnosticBag & diags) const
{
  const ir::ActionDefinition * action = config.find_action(call.action_name);
  if (action == nullptr) {
    diags.report_error(call.range, fmt::format("Unknown action '{}'", call.action_name))
      .with_code("UNKNOWN_ACTION")
      .with_help(fmt::format("Declare it with: action {}() [ ... ]", call.action_name));
    return;
  }

  if (call.args.size() != action->parameters.size()) {
    std::vector<std::string> params;
    for (const auto & p : action->parameters) params.push_back(p.name);
    diags
      .report_error(
        call.range, fmt::format(
                      "Action '{}' expects {} argument(s), but got {}", call.action_name,
                      action->parameters.size(), call.args.size()))
      .with_code("ACTION_ARGUMENT_COUNT")
      .with_help(fmt::format("Expected: {}({})", call.action_name, join(params)));
  }
}

// ============================================================================
// CSS and labels
// ============================================================================

bool Validator::has_stylesheets() const
{
  return !registries_.document_imports(imports_.document_uri()).css_files.empty();
}

void Validator::check_selector(
  const std::string & selector, SourceRange range, DiagnosticBag & diags) const
{
  if (!has_stylesheets()) return;

  const SelectorParseResult parsed = parse_selector(selector);
  if (!parsed.ok()) {
    diags.report_error(range, fmt::format("Invalid CSS selector '{}': {}", selector, *parsed.error))
      .with_code("INVALID_CSS_SELECTOR")
      .with_help("Check brackets and quotes, and that every '.' or '#' is followed by a name");
    return;
  }

  const std::string & doc = imports_.document_uri();
  for (const auto & cls : parsed.tokens.classes) {
    if (!registries_.has_class(doc, cls)) {
      diags.report_error(range, fmt::format("Unknown CSS class: '{}'", cls))
        .with_code("UNKNOWN_CSS_CLASS")
        .with_help(suggestion_hint(cls, registries_.classes_for(doc), "classes"));
    }
  }
  for (const auto & id : parsed.tokens.ids) {
    if (!registries_.has_id(doc, id)) {
      diags.report_error(range, fmt::format("Unknown CSS ID: '{}'", id))
        .with_code("UNKNOWN_CSS_ID")
        .with_help(suggestion_hint(id, registries_.ids_for(doc), "IDs"));
    }
  }
}

void Validator::check_class_name(
  const std::string & class_name, SourceRange range, DiagnosticBag & diags) const
{
  if (!has_stylesheets()) return;

  // addClass("active") and addClass(".active") name the same class
  const std::string name = !class_name.empty() && class_name[0] == '.' ? class_name.substr(1) : class_name;
  const std::string & doc = imports_.document_uri();
  if (!registries_.has_class(doc, name)) {
    diags.report_error(range, fmt::format("Unknown CSS class: '{}'", name))
      .with_code("UNKNOWN_CSS_CLASS")
      .with_help(suggestion_hint(name, registries_.classes_for(doc), "classes"));
  }
}

void Validator::check_label(
  const std::string & label_id, SourceRange range, DiagnosticBag & diags) const
{
  const std::string & doc = imports_.document_uri();
  if (!imports_.has_default(ImportCategory::Labels)) {
    diags
      .report_error(
        range, fmt::format("Label '{}' is referenced, but no labels file is imported", label_id))
      .with_code("NO_LABELS_IMPORT")
      .with_help("Import a labels file: labels \"./labels.json\"");
    return;
  }

  // The loader already reported a labels file that could not be read
  if (registries_.document_imports(doc).label_files.empty()) return;

  const auto known = registries_.label_ids_for(doc);
  if (std::find(known.begin(), known.end(), label_id) == known.end()) {
    diags.report_error(range, fmt::format("Unknown label ID: '{}'", label_id))
      .with_code("UNKNOWN_LABEL_ID")
      .with_help(suggestion_hint(label_id, known, "label IDs"));
  }
}

}  // namespace eligian
