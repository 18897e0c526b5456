#include "backend_factory.hpp"

#include "lan_backend.hpp"

#ifdef TRANSCRIBE_BOT_WITH_WHISPER
#include "local_backend.hpp"
#endif

std::expected<std::unique_ptr<SpeechModel>, std::string>
make_speech_model(const Config::Backend& backend) {
    if (backend.type == "lan") {
        return std::make_unique<LanBackend>(backend.url, backend.api_format,
                                            backend.language, backend.model);
    }

    if (backend.type == "local") {
#ifdef TRANSCRIBE_BOT_WITH_WHISPER
        auto model = LocalWhisperBackend::create(
            resolve_model_path(backend.model, backend.models_dir),
            backend.language, static_cast<int>(backend.threads));
        if (!model) return std::unexpected(model.error());
        return std::unique_ptr<SpeechModel>(std::move(*model));
#else
        return std::unexpected("built without whisper.cpp, backend 'local' unavailable");
#endif
    }

    return std::unexpected("unknown backend type: " + backend.type);
}
