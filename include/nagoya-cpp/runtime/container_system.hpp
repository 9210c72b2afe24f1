#pragma once

#include <nagoya-cpp/core/config.hpp>
#include <nagoya-cpp/engine/container_engine.hpp>
#include <nagoya-cpp/runtime/container.hpp>
#include <nagoya-cpp/runtime/container_spec.hpp>
#include <nagoya-cpp/runtime/persistence.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace nagoya_cpp {
namespace runtime {

struct SystemMember {
    ContainerSpec spec;
    Disposition disposition;
};

/**
 * @brief One root container plus the auxiliaries it references by name
 */
struct ContainerSystemSpec {
    SystemMember root;
    std::vector<SystemMember> auxiliaries;
};

/**
 * @brief Brings up a root container and its dependencies, applies dispositions, tears everything down
 *
 * The dependency graph is resolved in the constructor: unknown names,
 * duplicates and cycles are reported before any container exists. Every
 * container this instance creates, persistence helpers included, is removed
 * in reverse creation order when run() returns or throws.
 */
class ContainerSystem {
public:
    ContainerSystem(ContainerSystemSpec spec, ContainerEngine& engine, BuildSettings settings = {});
    ~ContainerSystem() = default;

    // Non-copyable, non-movable
    ContainerSystem(const ContainerSystem&) = delete;
    ContainerSystem& operator=(const ContainerSystem&) = delete;
    ContainerSystem(ContainerSystem&&) = delete;
    ContainerSystem& operator=(ContainerSystem&&) = delete;

    /**
     * @brief Run the build once
     * @return Tags of the images produced by commit and persist dispositions
     */
    std::vector<std::string> run();

    // Auxiliary names, dependencies first
    const std::vector<std::string>& getBringUpOrder() const
    {
        return bring_up_order_;
    }
    // Every container created so far, in creation order
    std::vector<std::string> getCreatedNames() const;

    Container& getRoot()
    {
        return *root_.container;
    }
    Container& getAuxiliary(const std::string& name);
    bool hasRun() const
    {
        return has_run_;
    }

private:
    struct Member {
        std::unique_ptr<Container> container;
        Disposition disposition;
    };

    ContainerEngine& engine_;
    BuildSettings settings_;
    PersistenceExtractor extractor_;
    Member root_;
    std::unordered_map<std::string, Member> auxiliaries_;
    std::vector<std::string> bring_up_order_;
    std::vector<Container*> created_;
    std::vector<std::unique_ptr<Container>> helpers_;
    bool has_run_ = false;

    void resolve(std::vector<SystemMember> auxiliaries);
    void bringUp(Container& container);
    void stopAuxiliaries();
    void applyDisposition(Container& container, const Disposition& disposition,
                          std::vector<std::string>& produced);
    Container& makeHelper(ContainerSpec spec);
    void teardown(bool raise_errors);
};

} // namespace runtime
} // namespace nagoya_cpp
