//
// processor_registry.cpp
//

#include "../../include/processor_registry.hpp"
#include "../../include/legacy_processor.hpp"
#include "../../include/ooxml_processor.hpp"
#include "../../include/pdf_processor.hpp"

namespace docscrub {

ProcessorRegistry::ProcessorRegistry() {
    processors_.push_back(std::make_unique<OOXMLProcessor>());
    processors_.push_back(std::make_unique<PdfProcessor>());
    processors_.push_back(std::make_unique<LegacyProcessor>());
}

ProcessorRegistry::ProcessorRegistry(std::unique_ptr<ILegacyConverter> legacy_converter) {
    processors_.push_back(std::make_unique<OOXMLProcessor>());
    processors_.push_back(std::make_unique<PdfProcessor>());
    processors_.push_back(std::make_unique<LegacyProcessor>(std::move(legacy_converter)));
}

IProcessor* ProcessorRegistry::find_by_format(const ContainerFormat format) const {
    for (const auto& proc_ptr : processors_) {
        if (proc_ptr->handles(format)) {
            return proc_ptr.get();
        }
    }
    return nullptr;
}

std::vector<IProcessor*> ProcessorRegistry::find_by_mime(const std::string& mime) const {
    std::vector<IProcessor*> result;
    for (const auto& proc_ptr : processors_) {
        for (const auto supported_mime : proc_ptr->get_supported_mime_types()) {
            if (supported_mime == mime) {
                result.push_back(proc_ptr.get());
            }
        }
    }
    return result;
}

std::vector<IProcessor*> ProcessorRegistry::find_by_extension(const std::string& ext) const {
    std::vector<IProcessor*> result;
    if (ext.empty() || ext[0] != '.') return result;

    const std::string lowered = normalize_extension(ext);
    for (const auto& proc_ptr : processors_) {
        for (const auto supported_ext : proc_ptr->get_supported_extensions()) {
            if (supported_ext == lowered) {
                result.push_back(proc_ptr.get());
                break;
            }
        }
    }
    return result;
}

} // namespace docscrub
