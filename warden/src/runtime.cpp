#include <warden/runtime.hpp>
#include <warden/http_generator.hpp>
#include <warden/log.hpp>
#include <warden/sqlite_store.hpp>

#include <filesystem>

namespace warden {

namespace {

std::unique_ptr<FactStore> open_store(const std::string& path) {
    if (path.empty() || path == ":memory:") {
        log::info("runtime", "Using in-memory fact store");
        return std::make_unique<MemoryFactStore>();
    }
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreError("cannot create " + parent.string() + ": " + ec.message());
        }
    }
    return std::make_unique<SqliteFactStore>(path);
}

// A generator only makes sense with a key or a non-default (local) endpoint
std::unique_ptr<TextGenerator> make_generator(const LlmConfig& llm) {
    if (llm.api_key.empty() && llm.base_url == LlmConfig{}.base_url) {
        log::info("runtime", "No LLM configured: intents default to general_chat, Gate 2 off");
        return nullptr;
    }
    return std::make_unique<HttpGenerator>(llm);
}

} // namespace

Runtime::Runtime(Config config)
    : config_(std::move(config)),
      ontology_(config_.ontology_path.empty()
                    ? AllergenOntology::builtin()
                    : AllergenOntology::load(config_.ontology_path)),
      interactions_(config_.interactions_path.empty()
                        ? InteractionTable::builtin()
                        : InteractionTable::load(config_.interactions_path)),
      safety_(SafetyIndex::builtin()),
      store_(open_store(config_.db_path)),
      generator_(make_generator(config_.llm)) {
    if (!config_.catalog_path.empty()) {
        auto catalog = std::make_unique<CatalogSource>(CatalogSource::load(config_.catalog_path));
        log::info("runtime", "Loaded %zu catalog products", catalog->size());
        source_ = std::move(catalog);
    }
    wire();
    log::info("runtime", "Ontology v%d (%zu groups), interactions v%d (%zu rules)",
              ontology_.version(), ontology_.groups().size(),
              interactions_.version(), interactions_.rules().size());
}

Runtime::Runtime(Config config,
                 std::unique_ptr<FactStore> store,
                 std::unique_ptr<TextGenerator> generator,
                 std::unique_ptr<CandidateSource> source)
    : config_(std::move(config)),
      ontology_(AllergenOntology::builtin()),
      interactions_(InteractionTable::builtin()),
      safety_(SafetyIndex::builtin()),
      store_(store ? std::move(store) : std::make_unique<MemoryFactStore>()),
      generator_(std::move(generator)),
      source_(std::move(source)) {
    wire();
}

void Runtime::wire() {
    memory_ = std::make_unique<MemoryService>(*store_, config_.constraint_load_policy);
    pipeline_ = std::make_unique<TurnPipeline>(PipelineDeps{
        detector_, ontology_, interactions_, safety_,
        memory_.get(), generator_.get(), source_.get()
    });
    if (generator_) {
        extractor_ = std::make_unique<MemoryExtractor>(*generator_, *memory_);
    }
}

TurnResult Runtime::process_turn(const TurnRequest& request, const std::string& conversation_id) {
    TurnResult result = pipeline_->run(request);

    if (!conversation_id.empty() && extractor_ && !request.user_id.empty() &&
        !extraction_.completed(conversation_id)) {
        std::vector<ChatMessage> transcript;
        {
            std::lock_guard<std::mutex> lock(conversations_mutex_);
            auto& messages = conversations_[conversation_id];
            messages.push_back({"user", request.message});
            transcript = messages;
        }
        extractor_->schedule(extraction_, conversation_id, request.user_id,
                             std::move(transcript), now(), config_.extraction_delay_ms);
    }
    return result;
}

size_t Runtime::tick(Timestamp at) {
    size_t ran = extraction_.run_due(at);

    // Completed or dropped: the transcript is no longer needed
    std::lock_guard<std::mutex> lock(conversations_mutex_);
    for (auto it = conversations_.begin(); it != conversations_.end();) {
        if (!extraction_.scheduled(it->first)) {
            it = conversations_.erase(it);
        } else {
            ++it;
        }
    }
    return ran;
}

} // namespace warden
