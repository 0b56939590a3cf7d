//
// xml_patch_engine.hpp
//

/**
 * @file xml_patch_engine.hpp
 * @brief Declarative, span-based element removal for OOXML parts.
 */

#ifndef DOCSCRUB_XML_PATCH_ENGINE_HPP
#define DOCSCRUB_XML_PATCH_ENGINE_HPP

#include "file_type.hpp"
#include "process_result.hpp"
#include "sanitize_options.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docscrub {

enum class ArtifactClass {
    Protection,
    Watermark
};

/**
 * @brief Removes every @ref element in parts matching @ref part_glob.
 *
 * The glob is either an exact part name or contains a single '*' that
 * matches any run of characters except '/'. When @ref must_contain is not
 * empty, only spans containing it (ASCII case-insensitive) are removed.
 */
struct PatchRule {
    std::string part_glob;
    std::string element;      ///< qualified name as written, e.g. "w:documentProtection"
    std::string must_contain;
    ArtifactClass artifact_class = ArtifactClass::Protection;
    WatermarkKind watermark;  ///< reported kind, watermark rules only
};

using RuleSet = std::vector<PatchRule>;

/**
 * @brief One removed (or, in scan mode, removable) element.
 */
struct PatchMatch {
    const PatchRule* rule = nullptr; ///< points into the RuleSet passed to apply_rules()
    std::size_t offset = 0;          ///< byte offset in the content the rule saw
};

struct PatchOutcome {
    std::string content;           ///< patched content, equal to the input when !changed
    bool changed = false;
    std::size_t removed_count = 0;
    std::vector<PatchMatch> matches;
};

/**
 * @brief Half-open byte range [begin, end) covering one element.
 */
struct ElementSpan {
    std::size_t begin = 0;
    std::size_t end = 0;
};

class XmlPatchEngine {
public:
    /**
     * @brief Glob test for part names.
     */
    [[nodiscard]] static bool part_matches(std::string_view glob, std::string_view part_name);

    /**
     * @brief Locates every outermost @p qname element in @p content.
     *
     * Handles self-closing and open/close forms, tracks nesting of the same
     * name so a span ends at its matching close tag, honours quoted
     * attribute values, and skips comments, CDATA sections, processing
     * instructions and declarations.
     *
     * @throws SanitizeError (CorruptContainer) on an unterminated tag,
     *         comment or CDATA section, or an element left open at EOF.
     */
    [[nodiscard]] static std::vector<ElementSpan> find_elements(std::string_view content, std::string_view qname);

    /**
     * @brief Applies the rules scoped to @p part_name, in order.
     *
     * Each rule sees the output of the previous one. Bytes outside removed
     * spans are preserved exactly.
     */
    [[nodiscard]] static PatchOutcome apply_rules(std::string_view part_name,
                                                  std::string_view content,
                                                  const RuleSet& rules);

    /**
     * @brief Built-in rule catalog for a document kind, filtered by targets.
     */
    [[nodiscard]] static RuleSet default_rules(DocumentKind kind, TargetSet targets);
};

} // namespace docscrub

#endif // DOCSCRUB_XML_PATCH_ENGINE_HPP
