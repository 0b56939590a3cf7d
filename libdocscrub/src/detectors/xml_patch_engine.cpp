//
// xml_patch_engine.cpp
//

#include "../../include/xml_patch_engine.hpp"
#include "../../include/errors.hpp"
#include "../../include/text_utils.hpp"
#include <algorithm>

namespace docscrub {

namespace {

bool is_name_end(const char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '/' || c == '>';
}

// skips to the end of a construct terminated by `terminator`, returns the index past it
std::size_t skip_past(const std::string_view s, const std::size_t from, const std::string_view terminator,
                      const char* what) {
    const auto pos = s.find(terminator, from);
    if (pos == std::string_view::npos) {
        throw SanitizeError(ErrorKind::CorruptContainer, std::string("unterminated ") + what);
    }
    return pos + terminator.size();
}

// index of the '>' closing the tag opened at `lt`, ignoring '>' inside quoted values
std::size_t find_tag_end(const std::string_view s, const std::size_t lt) {
    char quote = 0;
    for (std::size_t i = lt + 1; i < s.size(); ++i) {
        const char c = s[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return i;
        }
    }
    throw SanitizeError(ErrorKind::CorruptContainer, "unterminated tag at offset " + std::to_string(lt));
}

std::string_view read_name(const std::string_view s, const std::size_t from) {
    std::size_t end = from;
    while (end < s.size() && !is_name_end(s[end])) ++end;
    return s.substr(from, end - from);
}

} // namespace

bool XmlPatchEngine::part_matches(const std::string_view glob, const std::string_view part_name) {
    const auto star = glob.find('*');
    if (star == std::string_view::npos) {
        return glob == part_name;
    }
    const auto prefix = glob.substr(0, star);
    const auto suffix = glob.substr(star + 1);
    if (part_name.size() < prefix.size() + suffix.size()) return false;
    if (!part_name.starts_with(prefix) || !part_name.ends_with(suffix)) return false;
    const auto middle = part_name.substr(prefix.size(), part_name.size() - prefix.size() - suffix.size());
    return middle.find('/') == std::string_view::npos;
}

std::vector<ElementSpan> XmlPatchEngine::find_elements(const std::string_view content, const std::string_view qname) {
    std::vector<ElementSpan> spans;
    std::size_t depth = 0;
    std::size_t start = 0;
    std::size_t i = 0;

    while ((i = content.find('<', i)) != std::string_view::npos) {
        const auto rest = content.substr(i);
        if (rest.starts_with("<!--")) {
            i = skip_past(content, i + 4, "-->", "comment");
            continue;
        }
        if (rest.starts_with("<![CDATA[")) {
            i = skip_past(content, i + 9, "]]>", "CDATA section");
            continue;
        }
        if (rest.starts_with("<?")) {
            i = skip_past(content, i + 2, "?>", "processing instruction");
            continue;
        }
        if (rest.starts_with("<!")) {
            i = find_tag_end(content, i) + 1;
            continue;
        }

        const std::size_t gt = find_tag_end(content, i);

        if (rest.starts_with("</")) {
            if (depth > 0 && read_name(content, i + 2) == qname && --depth == 0) {
                spans.push_back({start, gt + 1});
            }
            i = gt + 1;
            continue;
        }

        if (read_name(content, i + 1) == qname) {
            const bool self_closing = content[gt - 1] == '/';
            if (depth == 0) {
                if (self_closing) {
                    spans.push_back({i, gt + 1});
                } else {
                    start = i;
                    depth = 1;
                }
            } else if (!self_closing) {
                ++depth;
            }
        }
        i = gt + 1;
    }

    if (depth > 0) {
        throw SanitizeError(ErrorKind::CorruptContainer,
                            "element <" + std::string(qname) + "> is never closed");
    }
    return spans;
}

PatchOutcome XmlPatchEngine::apply_rules(const std::string_view part_name,
                                         const std::string_view content,
                                         const RuleSet& rules) {
    PatchOutcome outcome;
    outcome.content.assign(content);

    for (const auto& rule : rules) {
        if (!part_matches(rule.part_glob, part_name)) continue;

        auto spans = find_elements(outcome.content, rule.element);
        std::erase_if(spans, [&](const ElementSpan& span) {
            if (rule.must_contain.empty()) return false;
            const std::string_view body(outcome.content.data() + span.begin, span.end - span.begin);
            return !icontains(body, rule.must_contain);
        });
        if (spans.empty()) continue;

        for (const auto& span : spans) {
            outcome.matches.push_back({&rule, span.begin});
        }
        // back to front so earlier offsets stay valid
        for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
            outcome.content.erase(it->begin, it->end - it->begin);
        }
        outcome.removed_count += spans.size();
        outcome.changed = true;
    }
    return outcome;
}

RuleSet XmlPatchEngine::default_rules(const DocumentKind kind, const TargetSet targets) {
    RuleSet catalog;
    switch (kind) {
        case DocumentKind::WordProcessing:
            catalog = {
                {"word/settings.xml", "w:documentProtection", "", ArtifactClass::Protection, {}},
                {"word/settings.xml", "w:writeProtection", "", ArtifactClass::Protection, {}},
                {"word/header*.xml", "w:pict", "#_x0000_t136", ArtifactClass::Watermark,
                 VmlWatermark{"#_x0000_t136"}},
                {"word/header*.xml", "w:pict", "rotation:", ArtifactClass::Watermark,
                 VmlWatermark{"rotation:"}},
                {"word/header*.xml", "w:pict", "PowerPlusWaterMarkObject", ArtifactClass::Watermark,
                 VmlWatermark{"PowerPlusWaterMarkObject"}},
                {"word/document.xml", "w:background", "", ArtifactClass::Watermark, BackgroundFill{}},
            };
            break;
        case DocumentKind::Spreadsheet:
            catalog = {
                {"xl/workbook.xml", "workbookProtection", "", ArtifactClass::Protection, {}},
                {"xl/worksheets/sheet*.xml", "sheetProtection", "", ArtifactClass::Protection, {}},
                {"xl/worksheets/sheet*.xml", "picture", "", ArtifactClass::Watermark, BackgroundPicture{}},
            };
            break;
        case DocumentKind::Presentation:
            catalog = {
                {"ppt/presentation.xml", "p:modifyVerifier", "", ArtifactClass::Protection, {}},
            };
            break;
        default:
            break;
    }

    std::erase_if(catalog, [targets](const PatchRule& rule) {
        if (rule.artifact_class == ArtifactClass::Protection) return targets == TargetSet::Watermark;
        return targets == TargetSet::Protection;
    });
    return catalog;
}

} // namespace docscrub
