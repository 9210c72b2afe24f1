#include <nagoya-cpp/core/error.hpp>
#include <nagoya-cpp/core/logger.hpp>
#include <nagoya-cpp/runtime/container_system.hpp>

#include <exception>
#include <functional>
#include <set>

namespace nagoya_cpp {
namespace runtime {

namespace {

Logger* logger()
{
    return Logger::getInstance(BUILD_LOGGER);
}

} // namespace

ContainerSystem::ContainerSystem(ContainerSystemSpec spec, ContainerEngine& engine, BuildSettings settings)
    : engine_(engine), settings_(std::move(settings)), extractor_(engine, settings_)
{
    spec.root.spec.detach = false;
    root_.disposition = spec.root.disposition;
    root_.container = std::make_unique<Container>(std::move(spec.root.spec), engine_);
    root_.container->setStopTimeouts(settings_.stop_timeout, settings_.stop_timeout);

    resolve(std::move(spec.auxiliaries));
}

void ContainerSystem::resolve(std::vector<SystemMember> auxiliaries)
{
    const std::string& root_name = root_.container->getName();

    for (auto& member : auxiliaries) {
        if (member.spec.name.empty()) {
            throw BuildError(ErrorCode::CONFIG_INVALID,
                             "Auxiliary container from image " + member.spec.image + " has no name");
        }
        std::string name = member.spec.name;
        if (name == root_name || auxiliaries_.count(name) > 0) {
            throw BuildError(ErrorCode::DUPLICATE_CONTAINER_NAME, "Container name used twice: " + name);
        }
        Member resolved;
        resolved.disposition = member.disposition;
        resolved.container = std::make_unique<Container>(std::move(member.spec), engine_);
        resolved.container->setStopTimeouts(settings_.stop_timeout, settings_.stop_timeout);
        auxiliaries_.emplace(name, std::move(resolved));
    }

    // Volume providers must have run before their consumers start; link targets run alongside
    std::set<std::string> blocking;
    std::set<std::string> detached;
    auto classify = [&](const Container& container) {
        for (const auto& link : container.getSpec().volumes_from) {
            blocking.insert(link.container_name);
        }
        for (const auto& link : container.getSpec().links) {
            detached.insert(link.container_name);
        }
    };

    std::unordered_map<std::string, bool> visited;
    std::unordered_map<std::string, bool> visiting;

    // DFS-based topological sort, dependencies first
    std::function<void(const std::string&, const std::string&)> visit =
        [&](const std::string& name, const std::string& referrer) {
            if (name == root_name || visiting[name]) {
                throw BuildError(ErrorCode::CIRCULAR_DEPENDENCY,
                                 "Circular dependency detected involving container: " + name);
            }
            if (visited[name]) {
                return;
            }

            auto it = auxiliaries_.find(name);
            if (it == auxiliaries_.end()) {
                throw BuildError(ErrorCode::UNKNOWN_DEPENDENCY,
                                 "Container " + referrer + " references unknown container: " + name);
            }

            visiting[name] = true;
            const Container& container = *it->second.container;
            classify(container);
            for (const auto& dependency : container.dependencyNames()) {
                visit(dependency, name);
            }
            visiting[name] = false;
            visited[name] = true;
            bring_up_order_.push_back(name);
        };

    classify(*root_.container);
    for (const auto& dependency : root_.container->dependencyNames()) {
        visit(dependency, root_name);
    }

    for (const auto& name : bring_up_order_) {
        ContainerSpec& spec = auxiliaries_.at(name).container->getSpec();
        if (blocking.count(name) > 0) {
            spec.detach = false;
        }
        else if (detached.count(name) > 0) {
            spec.detach = true;
        }
    }

    for (const auto& entry : auxiliaries_) {
        if (!visited[entry.first]) {
            logger()->warning("Container {} is not referenced by the root container and will be ignored",
                              entry.first);
        }
    }
}

Container& ContainerSystem::getAuxiliary(const std::string& name)
{
    auto it = auxiliaries_.find(name);
    if (it == auxiliaries_.end()) {
        throw BuildError(ErrorCode::UNKNOWN_DEPENDENCY, "No auxiliary container named " + name);
    }
    return *it->second.container;
}

std::vector<std::string> ContainerSystem::getCreatedNames() const
{
    std::vector<std::string> names;
    names.reserve(created_.size());
    for (const auto* container : created_) {
        names.push_back(container->getName());
    }
    return names;
}

void ContainerSystem::bringUp(Container& container)
{
    // Tracked before create, so a half-created container is still removed
    created_.push_back(&container);
    container.init();
}

std::vector<std::string> ContainerSystem::run()
{
    if (has_run_) {
        throw BuildError(ErrorCode::CONTAINER_STATE_INVALID,
                         "Container system " + root_.container->getName() + " has already run");
    }
    has_run_ = true;

    std::vector<std::string> produced;
    try {
        for (const auto& name : bring_up_order_) {
            bringUp(*auxiliaries_.at(name).container);
        }
        bringUp(*root_.container);

        stopAuxiliaries();

        applyDisposition(*root_.container, root_.disposition, produced);
        for (const auto& name : bring_up_order_) {
            Member& member = auxiliaries_.at(name);
            applyDisposition(*member.container, member.disposition, produced);
        }
    }
    catch (...) {
        teardown(false);
        throw;
    }

    teardown(true);
    return produced;
}

void ContainerSystem::stopAuxiliaries()
{
    for (auto it = bring_up_order_.rbegin(); it != bring_up_order_.rend(); ++it) {
        auxiliaries_.at(*it).container->stop();
    }
}

void ContainerSystem::applyDisposition(Container& container,
                                       const Disposition& disposition,
                                       std::vector<std::string>& produced)
{
    switch (disposition.kind) {
        case Disposition::Kind::DISCARD:
            logger()->debug("Container {} will be discarded", container.getName());
            return;
        case Disposition::Kind::COMMIT: {
            logger()->info("Committing container {} to image {}", container.getName(),
                           disposition.target_image);
            std::string image_id = engine_.commit(container.getName(), disposition.target_image);
            logger()->debug("Committed image {} ({})", disposition.target_image, image_id);
            produced.push_back(disposition.target_image);
            return;
        }
        case Disposition::Kind::PERSIST:
            extractor_.persist(container, disposition.target_image,
                               [this](ContainerSpec spec) -> Container& { return makeHelper(std::move(spec)); });
            produced.push_back(disposition.target_image);
            return;
    }
}

Container& ContainerSystem::makeHelper(ContainerSpec spec)
{
    helpers_.push_back(std::make_unique<Container>(std::move(spec), engine_));
    Container& helper = *helpers_.back();
    helper.setStopTimeouts(settings_.stop_timeout, settings_.stop_timeout);
    created_.push_back(&helper);
    return helper;
}

void ContainerSystem::teardown(bool raise_errors)
{
    std::exception_ptr first_error;

    for (auto it = created_.rbegin(); it != created_.rend(); ++it) {
        Container& container = **it;
        try {
            container.remove();
        }
        catch (const std::exception& e) {
            logger()->error("Failed to remove container {}: {}", container.getName(), e.what());
            if (raise_errors && !first_error) {
                first_error = std::current_exception();
            }
        }
        catch (...) {
            logger()->error("Failed to remove container {}: unknown error", container.getName());
            if (raise_errors && !first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace runtime
} // namespace nagoya_cpp
