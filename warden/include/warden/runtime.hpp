#pragma once
// Runtime: everything one wardend process shares across turns
//
// Tables, detector and pipeline are built once and read-only afterwards.
// The store, generator and catalog are optional and chosen by Config.
// Conversation transcripts are kept only until their extraction completes
// or is dropped.

#include "candidate_source.hpp"
#include "config.hpp"
#include "extraction_queue.hpp"
#include "fact_store.hpp"
#include "generator.hpp"
#include "interactions.hpp"
#include "memory_extractor.hpp"
#include "memory_service.hpp"
#include "ontology.hpp"
#include "override_detector.hpp"
#include "pipeline.hpp"
#include "safety_index.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace warden {

class Runtime {
public:
    // Throws ConfigError, OntologyError or StoreError
    explicit Runtime(Config config);

    // For tests: caller-owned collaborators, builtin tables
    Runtime(Config config,
            std::unique_ptr<FactStore> store,
            std::unique_ptr<TextGenerator> generator,
            std::unique_ptr<CandidateSource> source);

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    const Config& config() const { return config_; }
    const AllergenOntology& ontology() const { return ontology_; }
    const InteractionTable& interactions() const { return interactions_; }
    const SafetyIndex& safety() const { return safety_; }
    const OverrideDetector& detector() const { return detector_; }
    FactStore& store() { return *store_; }
    MemoryService& memory() { return *memory_; }
    TextGenerator* generator() { return generator_.get(); }
    const TurnPipeline& pipeline() const { return *pipeline_; }
    ExtractionQueue& extraction() { return extraction_; }

    // Pipeline run plus transcript bookkeeping and extraction scheduling
    TurnResult process_turn(const TurnRequest& request, const std::string& conversation_id = "");

    // Run due background jobs; called from the host loop
    size_t tick(Timestamp at = now());

    // Conversations whose transcript is held for extraction
    size_t transcripts() {
        std::lock_guard<std::mutex> lock(conversations_mutex_);
        return conversations_.size();
    }

private:
    Config config_;
    AllergenOntology ontology_;
    InteractionTable interactions_;
    SafetyIndex safety_;
    OverrideDetector detector_;
    std::unique_ptr<FactStore> store_;
    std::unique_ptr<TextGenerator> generator_;
    std::unique_ptr<CandidateSource> source_;
    std::unique_ptr<MemoryService> memory_;
    std::unique_ptr<TurnPipeline> pipeline_;
    std::unique_ptr<MemoryExtractor> extractor_;
    ExtractionQueue extraction_;

    std::mutex conversations_mutex_;
    std::map<std::string, std::vector<ChatMessage>> conversations_;

    void wire();
};

} // namespace warden
