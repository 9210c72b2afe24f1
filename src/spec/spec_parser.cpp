#include <nagoya-cpp/spec/spec_parser.hpp>

#include <filesystem>
#include <regex>
#include <sstream>

namespace nagoya_cpp {
namespace spec {

namespace {

const std::regex& dirSpecPattern()
{
    static const std::regex pattern(R"(^(.+) (?:in (.+)|at (.+))$)");
    return pattern;
}

const std::regex& volumeSpecPattern()
{
    static const std::regex pattern(R"(^([^ ]+) then (?:discard|persist to ([^ ]+))$)");
    return pattern;
}

const std::regex& linkSpecPattern()
{
    static const std::regex pattern(R"(^([^ ]+) alias ([^ ]+) then (?:discard|commit to ([^ ]+))$)");
    return pattern;
}

std::string trim(const std::string& str)
{
    const char* whitespace = " \t\r\n";
    size_t begin = str.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(begin, end - begin + 1);
}

std::string baseName(std::string path)
{
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return std::filesystem::path(path).filename().string();
}

} // namespace

ResourcePaths parseDirSpec(const std::string& spec,
                           const std::string& opt_name,
                           const std::string& image_name)
{
    std::smatch match;
    if (!std::regex_match(spec, match, dirSpecPattern())) {
        throw InvalidFormatError(opt_name, spec, image_name);
    }

    ResourcePaths paths;
    paths.source_path = match[1].str();

    if (match[2].matched) {
        paths.dest_dir = match[2].str();
        paths.dest_path =
            (std::filesystem::path(paths.dest_dir) / baseName(paths.source_path)).generic_string();
    }
    else {
        paths.dest_path = match[3].str();
        paths.dest_dir = std::filesystem::path(paths.dest_path).parent_path().generic_string();
    }

    return paths;
}

VolumeSpec parseVolumeSpec(const std::string& spec,
                           const std::string& opt_name,
                           const std::string& image_name)
{
    std::smatch match;
    if (!std::regex_match(spec, match, volumeSpecPattern())) {
        throw InvalidFormatError(opt_name, spec, image_name);
    }

    VolumeSpec result;
    result.image = match[1].str();
    result.disposition = match[2].matched ? runtime::Disposition::persist(match[2].str())
                                          : runtime::Disposition::discard();
    return result;
}

LinkSpec parseLinkSpec(const std::string& spec,
                       const std::string& opt_name,
                       const std::string& image_name)
{
    std::smatch match;
    if (!std::regex_match(spec, match, linkSpecPattern())) {
        throw InvalidFormatError(opt_name, spec, image_name);
    }

    LinkSpec result;
    result.image = match[1].str();
    result.alias = match[2].str();
    result.disposition = match[3].matched ? runtime::Disposition::commit(match[3].str())
                                          : runtime::Disposition::discard();
    return result;
}

std::vector<std::string> lineSplit(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

runtime::Env parseEnv(const std::string& text, const std::string& image_name)
{
    size_t pos = text.find('=');
    if (pos == std::string::npos || pos == 0) {
        throw InvalidFormatError("env", text, image_name);
    }
    return runtime::Env{text.substr(0, pos), text.substr(pos + 1)};
}

runtime::VolumeLink parseVolumeLink(const std::string& text, const std::string& image_name)
{
    runtime::VolumeLink link;
    size_t pos = text.find(':');
    if (pos == std::string::npos) {
        link.container_path = text;
    }
    else {
        link.host_path = text.substr(0, pos);
        link.container_path = text.substr(pos + 1);
        if (link.host_path->empty() || link.container_path.find(':') != std::string::npos) {
            throw InvalidFormatError("volume", text, image_name);
        }
    }

    if (link.container_path.empty()) {
        throw InvalidFormatError("volume", text, image_name);
    }
    return link;
}

runtime::VolumeFromLink parseVolumeFromLink(const std::string& text, const std::string& image_name)
{
    size_t pos = text.find(':');
    if (pos == std::string::npos || pos == 0) {
        throw InvalidFormatError("volume from", text, image_name);
    }

    std::string mode = text.substr(pos + 1);
    runtime::VolumeFromLink link;
    link.container_name = text.substr(0, pos);
    if (mode == "ro") {
        link.mode = runtime::VolumeMode::READ_ONLY;
    }
    else if (mode == "rw") {
        link.mode = runtime::VolumeMode::READ_WRITE;
    }
    else {
        throw InvalidFormatError("volume from", text, image_name);
    }
    return link;
}

runtime::NetworkLink parseNetworkLink(const std::string& text, const std::string& image_name)
{
    size_t pos = text.find(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 == text.size() ||
        text.find(':', pos + 1) != std::string::npos) {
        throw InvalidFormatError("link", text, image_name);
    }
    return runtime::NetworkLink{text.substr(0, pos), text.substr(pos + 1)};
}

EventCallback parseCallbackSpec(const std::string& text,
                                const HandlerCatalog& catalog,
                                const std::string& image_name)
{
    size_t colon = text.find(':');
    if (colon == std::string::npos) {
        throw InvalidFormatError("callback", text, image_name);
    }
    std::string event_spec = text.substr(0, colon);
    std::string handler_name = text.substr(colon + 1);

    size_t underscore = event_spec.find('_');
    if (underscore == std::string::npos || handler_name.empty()) {
        throw InvalidFormatError("callback", text, image_name);
    }

    EventCallback callback;
    callback.phase = parseLifecyclePhase(event_spec.substr(0, underscore));
    callback.event = parseLifecycleEvent(event_spec.substr(underscore + 1));
    callback.handler = catalog.resolve(handler_name);
    callback.handler_name = handler_name;
    return callback;
}

} // namespace spec
} // namespace nagoya_cpp
