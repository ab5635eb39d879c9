#pragma once

#include "chunkfs/Config.hpp"
#include "chunkfs/core/MetadataStore.hpp"

#include <cstdint>
#include <memory>

namespace chunkfs {

// The single master: owns the metadata store, answers client and node
// requests and periodically re-derives node liveness.
class Coordinator {
public:
    explicit Coordinator(Config config);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Loads persisted metadata, then starts the sweep and the listener.
    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::uint16_t port() const noexcept;

    // Runs one liveness sweep immediately.
    void sweep_now();

    MetadataStore& store() noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace chunkfs
