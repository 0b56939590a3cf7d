//
// processor_registry.hpp
//

/**
 * @file processor_registry.hpp
 * @brief Defines the registry that owns the container processors.
 */

#ifndef DOCSCRUB_PROCESSOR_REGISTRY_HPP
#define DOCSCRUB_PROCESSOR_REGISTRY_HPP

#include "legacy_bridge.hpp"
#include "processor.hpp"
#include <memory>
#include <string>
#include <vector>

namespace docscrub {

/**
 * @brief Registry of the available container processors.
 *
 * @details The ProcessorRegistry owns one processor per container family
 * (OOXML, PDF, legacy binary) and resolves the processor for a classified
 * document. It is typically instantiated once per execution and passed to
 * a ProcessorExecutor.
 */
class ProcessorRegistry {
public:
    /**
     * @brief Registers the built-in processors; legacy documents go through soffice.
     */
    ProcessorRegistry();

    /**
     * @brief Registers the built-in processors with a custom legacy converter.
     */
    explicit ProcessorRegistry(std::unique_ptr<ILegacyConverter> legacy_converter);

    /**
     * @brief Find the processor for a container format.
     * @return Non-owning pointer, or nullptr if none handles @p format.
     */
    [[nodiscard]] IProcessor* find_by_format(ContainerFormat format) const;

    /**
     * @brief Find all processors that support a given MIME type.
     */
    [[nodiscard]] std::vector<IProcessor*> find_by_mime(const std::string& mime) const;

    /**
     * @brief Find all processors that support a given file extension.
     *
     * Comparison is case-insensitive.
     *
     * @param ext File extension (including the dot, e.g. ".pdf").
     */
    [[nodiscard]] std::vector<IProcessor*> find_by_extension(const std::string& ext) const;

    /**
     * @brief Access all registered processors.
     */
    [[nodiscard]] const std::vector<std::unique_ptr<IProcessor>>& all() const { return processors_; }

private:
    ///< Owned instances of all registered processors.
    std::vector<std::unique_ptr<IProcessor>> processors_;
};

} // namespace docscrub

#endif // DOCSCRUB_PROCESSOR_REGISTRY_HPP
