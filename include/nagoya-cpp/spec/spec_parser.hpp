#pragma once

#include <nagoya-cpp/core/error.hpp>
#include <nagoya-cpp/core/event.hpp>
#include <nagoya-cpp/runtime/container_spec.hpp>

#include <string>
#include <vector>

namespace nagoya_cpp {
namespace spec {

/**
 * @brief Where a host resource ends up inside an image
 */
struct ResourcePaths {
    std::string source_path;
    std::string dest_path;
    std::string dest_dir;
};

struct VolumeSpec {
    std::string image;
    runtime::Disposition disposition;
};

struct LinkSpec {
    std::string image;
    std::string alias;
    runtime::Disposition disposition;
};

/**
 * @brief Parse "SOURCE in DIR" or "SOURCE at PATH"
 *
 * "in" places the source's base name inside DIR, "at" uses PATH as is and
 * derives the directory from it.
 *
 * @throws InvalidFormatError naming opt_name, the text and image_name
 */
ResourcePaths parseDirSpec(const std::string& spec,
                           const std::string& opt_name,
                           const std::string& image_name);

/**
 * @brief Parse "IMAGE then discard" or "IMAGE then persist to TARGET"
 */
VolumeSpec parseVolumeSpec(const std::string& spec,
                           const std::string& opt_name,
                           const std::string& image_name);

/**
 * @brief Parse "IMAGE alias ALIAS then discard" or "IMAGE alias ALIAS then commit to TARGET"
 */
LinkSpec parseLinkSpec(const std::string& spec,
                       const std::string& opt_name,
                       const std::string& image_name);

/**
 * @brief Split on newlines, trim each line and drop blank ones
 */
std::vector<std::string> lineSplit(const std::string& text);

// Text forms of the container data model
runtime::Env parseEnv(const std::string& text, const std::string& image_name = "");
runtime::VolumeLink parseVolumeLink(const std::string& text, const std::string& image_name = "");
runtime::VolumeFromLink parseVolumeFromLink(const std::string& text,
                                            const std::string& image_name = "");
runtime::NetworkLink parseNetworkLink(const std::string& text, const std::string& image_name = "");

/**
 * @brief Parse "PHASE_EVENT:HANDLER", resolving HANDLER in the catalog
 */
EventCallback parseCallbackSpec(const std::string& text,
                                const HandlerCatalog& catalog,
                                const std::string& image_name = "");

} // namespace spec
} // namespace nagoya_cpp
