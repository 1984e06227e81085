#include "runtime/Runtime.hpp"
#include "core/Log.hpp"

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace {

// --- Simulated services ---

/// Stand-in for a microphone capture pipeline.
class CaptureDevice : public tether::ResourceManageable {
public:
    std::string resourceId() const override { return "audio.capture"; }
    tether::ResourceKind resourceKind() const override { return tether::ResourceKind::Audio; }

    void initialize() override {
        m_buffer.assign(kBufferFrames, 0);
        SVC_LOG_INFO("Capture buffer allocated ({} frames)", kBufferFrames);
    }
    void activate() override { SVC_LOG_INFO("Capture started"); }
    void deactivate() override { SVC_LOG_INFO("Capture paused"); }
    void dispose() override {
        std::vector<int16_t>().swap(m_buffer);
        SVC_LOG_INFO("Capture device released");
    }

    tether::ResourceInfo describeSelf() const override {
        tether::ResourceInfo info;
        info.id = resourceId();
        info.kind = resourceKind();
        info.description = "Microphone capture";
        info.estimatedMemoryBytes = m_buffer.size() * sizeof(int16_t);
        info.metadata = {{"sampleRate", 16000}};
        return info;
    }

private:
    static constexpr size_t kBufferFrames = 16000 * 4;
    std::vector<int16_t> m_buffer;
};

/// Stand-in for a speech recognizer fed by the capture device.
class Recognizer : public tether::ResourceManageable {
public:
    std::string resourceId() const override { return "speech.recognizer"; }
    tether::ResourceKind resourceKind() const override { return tether::ResourceKind::Recognition; }

    void initialize() override { SVC_LOG_INFO("Recognizer model loaded"); }
    void activate() override { SVC_LOG_INFO("Recognizer listening"); }
    void deactivate() override { SVC_LOG_INFO("Recognizer idle"); }
    void dispose() override { SVC_LOG_INFO("Recognizer unloaded"); }
};

/// Scratch directory watcher; not critical, so it is parked in background.
class ScratchWatcher : public tether::ResourceManageable {
public:
    std::string resourceId() const override { return "files.scratch_watcher"; }
    tether::ResourceKind resourceKind() const override { return tether::ResourceKind::Observer; }

    void initialize() override {}
    void dispose() override {}
};

class TranscriptService : public tether::ServiceLifecycle {
public:
    void onLaunched() override { SVC_LOG_INFO("Transcript service ready"); }
    void onDidBackground() override { SVC_LOG_INFO("Flushing transcripts"); }
    void onWillTerminate() override { SVC_LOG_INFO("Transcript service stopping"); }
    void onLowMemory() override { SVC_LOG_WARN("Low memory, dropping transcript cache"); }
};

void registerDemoServices(tether::Runtime& runtime) {
    auto& registry = runtime.registry();

    auto check = [](const tether::Status& status) {
        if (!status) {
            LOG_ERROR("Registration failed: {}", status.message());
        }
    };
    check(registry.registerResource(std::make_unique<CaptureDevice>()));
    check(registry.registerResource(std::make_unique<Recognizer>(), {"audio.capture"}));
    check(registry.registerResource(std::make_unique<ScratchWatcher>()));

    runtime.coordinator().registerService("transcripts", std::make_shared<TranscriptService>());
    runtime.monitor().addCacheReleaser("transcripts", [] {
        SVC_LOG_DEBUG("Transcript cache released");
    });
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = "config.json";
    bool demo = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--demo") == 0) {
            demo = true;
        }
    }

    tether::Runtime runtime;
    if (!runtime.init(configPath)) {
        return 1;
    }

    if (demo) {
        registerDemoServices(runtime);
    }

    runtime.run();
    runtime.shutdown();

    return 0;
}
