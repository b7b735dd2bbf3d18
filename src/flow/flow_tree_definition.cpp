#include "flow/flow_tree_definition.h"

namespace callroute {
namespace flow {

namespace {

FlowNode node(const std::string& id, const std::string& label, NodeType type,
              const std::string& description, const std::string& checkpoint) {
    FlowNode n;
    n.id = id;
    n.label = label;
    n.type = type;
    n.description = description;
    n.checkpoint = checkpoint;
    return n;
}

FlowEdge edge(const std::string& id, const std::string& from, const std::string& to,
              const std::string& when) {
    FlowEdge e;
    e.id = id;
    e.from = from;
    e.to = to;
    e.when = when;
    return e;
}

RuntimeBinding binding(const std::string& node_id,
                       std::vector<std::string> checkpoints,
                       std::vector<std::string> match_sources,
                       std::vector<std::string> code_patterns,
                       std::vector<std::string> events = {}) {
    RuntimeBinding b;
    b.node_id = node_id;
    b.checkpoints = std::move(checkpoints);
    b.match_sources = std::move(match_sources);
    b.code_patterns = std::move(code_patterns);
    b.events = std::move(events);
    return b;
}

std::vector<FlowNode> build_nodes() {
    std::vector<FlowNode> nodes;

    nodes.push_back(node("node.callStart", "Call Start", NodeType::Entry,
        "Inbound turn received", "CHECKPOINT_1"));

    // Guards run before any routing
    {
        FlowNode n = node("node.emptyUtteranceGuard", "Empty Utterance Guard", NodeType::Guard,
            "Routes empty, punctuation-only or filler-only input to the silence handler",
            "CHECKPOINT_V92_EMPTY_GUARD");
        n.config_paths = {"routing.emptyUtteranceGuard.enabled"};
        n.code_location = "ConversationEngine:emptyUtteranceGuard";
        nodes.push_back(n);
    }
    {
        FlowNode n = node("node.silenceHandler", "Silence Handler", NodeType::Action,
            "Deterministic silence response (0 tokens)", "SILENCE_HANDLER");
        n.match_source = "SILENCE_HANDLER";
        nodes.push_back(n);
    }
    {
        FlowNode n = node("node.slotExtraction", "Slot Extraction", NodeType::Action,
            "Extract name, phone, address and time from the utterance", "CHECKPOINT_8");
        n.config_paths = {"frontDesk.bookingSlots", "frontDesk.addressValidation.rejectQuestions"};
        n.code_location = "ConversationEngine:slotExtraction";
        nodes.push_back(n);
    }

    // Booking mode
    {
        FlowNode n = node("node.bookingModeCheck", "Booking Mode Check", NodeType::Decision,
            "Is booking mode locked?", "CHECKPOINT_BRANCH_DECISION");
        n.config_paths = {"frontDesk.bookingBehavior.requireExplicitConsent"};
        nodes.push_back(n);
    }
    {
        FlowNode n = node("node.bookingRunner", "Booking Flow Runner", NodeType::Router,
            "Deterministic slot collection (no LLM)", "CHECKPOINT_9b");
        n.match_source = "BOOKING_SNAP";
        n.config_paths = {"frontDesk.bookingSlots", "frontDesk.askFullName", "frontDesk.confirmSpelling"};
        n.code_location = "BookingFlowRunner";
        nodes.push_back(n);
    }

    // Universal handlers
    {
        FlowNode n = node("node.metaIntentDetector", "Meta Intent Detector", NodeType::Detector,
            "Detect universal intents (human request, cancel)", "CHECKPOINT_V86_META");
        n.match_source = "META_INTENT_TIER1";
        n.config_paths = {"frontDesk.universalHandlers"};
        nodes.push_back(n);
    }

    // Consent
    {
        FlowNode n = node("node.directBookingIntentDetector", "Direct Booking Intent Detector",
            NodeType::Detector, "Detect direct requests such as \"get somebody out\" or \"schedule\"",
            "CHECKPOINT_DIRECT_INTENT");
        n.config_paths = {"booking.directIntentPatterns"};
        n.code_location = "DirectBookingIntentDetector";
        nodes.push_back(n);
    }
    {
        FlowNode n = node("node.consentGate", "Consent Gate", NodeType::Decision,
            "Check for explicit booking consent", "CHECKPOINT_CONSENT_CHECK");
        n.config_paths = {"frontDesk.bookingBehavior.requireExplicitConsent",
                          "frontDesk.bookingBehavior.consentPhrases"};
        n.code_location = "ConversationEngine:consentGate";
        nodes.push_back(n);
    }
    {
        FlowNode n = node("node.bookingTrigger", "Booking Mode Trigger", NodeType::Action,
            "Set bookingModeLocked and enter booking", "CHECKPOINT_BOOKING_TRIGGER");
        n.code_location = "ConversationEngine:bookingTrigger";
        nodes.push_back(n);
    }

    // Fast path booking
    {
        FlowNode n = node("node.fastPathIntentDetector", "Fast Path Intent Detector", NodeType::Detector,
            "Detect urgency keywords (schedule, ASAP, send someone)", "CHECKPOINT_9d_1");
        n.config_paths = {"frontDesk.fastPathBooking.enabled", "frontDesk.fastPathBooking.triggerKeywords"};
        n.code_location = "ConversationEngine:fastPathDetector";
        nodes.push_back(n);
    }
    {
        FlowNode n = node("node.fastPathOffer", "Fast Path Offer", NodeType::Action,
            "Speak the offer script and set bookingConsentPending", "FAST_PATH_OFFER");
        n.match_source = "FAST_PATH_BOOKING";
        n.config_paths = {"frontDesk.fastPathBooking.offerScript"};
        n.code_location = "ConversationEngine:fastPathOffer";
        nodes.push_back(n);
    }
    {
        FlowNode n = node("node.discoveryClarification", "Discovery Clarification", NodeType::Detector,
            "Ask clarifying questions for vague issues", "CHECKPOINT_V92_CLARIFY");
        n.config_paths = {"discovery.clarifyingQuestions.enabled",
                          "discovery.clarifyingQuestions.vaguePatterns"};
        n.code_location = "ConversationEngine:discoveryClarification";
        nodes.push_back(n);
    }

    // Scenario matching
    {
        FlowNode n = node("node.scenarioMatcher", "Scenario Matcher", NodeType::Router,
            "Candidate lookup plus scoring over the compiled scenario pool", "CHECKPOINT_SCENARIO_MATCH");
        n.match_source = "SCENARIO_MATCH";
        n.config_paths = {"scenarios.*.triggers", "scenarios.*.negativeTriggers", "scenarios.*.response"};
        n.code_location = "HybridScenarioSelector";
        nodes.push_back(n);
    }
    {
        FlowNode n = node("node.scenarioResponse", "Scenario Response", NodeType::Action,
            "Return the matched scenario reply", "SCENARIO_RESPONSE");
        n.match_source = "SCENARIO_MATCHED";
        nodes.push_back(n);
    }
    {
        FlowNode n = node("node.llmFallback", "LLM Fallback", NodeType::Router,
            "Tier-3 LLM when no deterministic match", "CHECKPOINT_9e");
        n.match_source = "LLM_FALLBACK";
        n.tier = "tier3";
        n.code_location = "HybridReceptionistLLM";
        nodes.push_back(n);
    }

    // Completion
    {
        FlowNode n = node("node.bookingComplete", "Booking Complete", NodeType::Action,
            "All slots collected, booking finalized", "BOOKING_COMPLETE");
        n.match_source = "BOOKING_COMPLETE";
        n.config_paths = {"frontDesk.bookingOutcome"};
        nodes.push_back(n);
    }
    {
        FlowNode n = node("node.turnEnd", "Turn End", NodeType::Exit,
            "Response built and sent; end of this turn, not call hangup", "TURN_END");
        n.note = "Agent response ready. The call continues after this node.";
        nodes.push_back(n);
    }

    return nodes;
}

std::vector<FlowEdge> build_edges() {
    return {
        edge("edge.1", "node.callStart", "node.emptyUtteranceGuard", "always"),

        edge("edge.2a", "node.emptyUtteranceGuard", "node.silenceHandler",
             "isEmpty || isPunctuationOnly || isFillerOnly"),
        edge("edge.2b", "node.emptyUtteranceGuard", "node.slotExtraction", "hasContent"),

        edge("edge.3", "node.slotExtraction", "node.bookingModeCheck", "always"),

        edge("edge.4a", "node.bookingModeCheck", "node.bookingRunner", "bookingModeLocked === true"),
        edge("edge.4b", "node.bookingModeCheck", "node.metaIntentDetector", "bookingModeLocked === false"),

        edge("edge.5a", "node.metaIntentDetector", "node.turnEnd", "humanRequest || cancel"),
        edge("edge.5b", "node.metaIntentDetector", "node.directBookingIntentDetector", "noMetaIntent"),

        // Direct intent honours requireExplicitConsent
        edge("edge.6a", "node.directBookingIntentDetector", "node.bookingTrigger",
             "hasDirectIntent && confidence >= 0.75 && requireExplicitConsent === false"),
        edge("edge.6b", "node.directBookingIntentDetector", "node.fastPathOffer",
             "hasDirectIntent && confidence >= 0.75 && requireExplicitConsent === true"),
        edge("edge.6c", "node.directBookingIntentDetector", "node.fastPathIntentDetector", "noDirectIntent"),

        // Fast path runs before the consent gate; it is how consent is asked for
        edge("edge.7a", "node.fastPathIntentDetector", "node.fastPathOffer", "fastPathTriggered"),
        edge("edge.7b", "node.fastPathIntentDetector", "node.consentGate",
             "noFastPath && bookingConsentPending"),
        edge("edge.7c", "node.fastPathIntentDetector", "node.discoveryClarification",
             "noFastPath && !bookingConsentPending"),

        edge("edge.8a", "node.consentGate", "node.bookingTrigger", "hasConsent"),
        edge("edge.8b", "node.consentGate", "node.discoveryClarification", "noConsent"),

        edge("edge.9", "node.bookingTrigger", "node.bookingRunner", "always"),

        edge("edge.10a", "node.discoveryClarification", "node.scenarioMatcher", "issueClear"),
        edge("edge.10b", "node.discoveryClarification", "node.turnEnd", "askClarifyingQuestion"),

        edge("edge.11a", "node.scenarioMatcher", "node.scenarioResponse", "scenarioMatched"),
        edge("edge.11b", "node.scenarioMatcher", "node.llmFallback", "noScenarioMatch"),

        edge("edge.12a", "node.bookingRunner", "node.bookingComplete", "allSlotsCollected"),
        edge("edge.12b", "node.bookingRunner", "node.turnEnd", "slotQuestionAsked"),

        edge("edge.13", "node.silenceHandler", "node.turnEnd", "always"),
        edge("edge.14", "node.scenarioResponse", "node.turnEnd", "always"),
        edge("edge.15", "node.llmFallback", "node.turnEnd", "always"),
        edge("edge.16", "node.fastPathOffer", "node.turnEnd", "always"),
        edge("edge.17", "node.bookingComplete", "node.turnEnd", "always")
    };
}

std::vector<RuntimeBinding> build_bindings() {
    std::vector<RuntimeBinding> bindings;

    bindings.push_back(binding("node.callStart",
        {"CHECKPOINT_1", "CALL_START"}, {},
        {"Starting processTurn", "CALL_START"},
        {"CALL_START"}));

    RuntimeBinding turn_end = binding("node.turnEnd",
        {"TURN_END", "TWIML_SENT", "AGENT_RESPONSE_BUILT"}, {},
        {"TURN_COMPLETE", "PATH_RESOLVED"},
        {"TWIML_SENT", "TURN_COMPLETE", "AGENT_RESPONSE_BUILT"});
    turn_end.note = "End of turn, not call hangup. The call continues.";
    bindings.push_back(turn_end);

    bindings.push_back(binding("node.emptyUtteranceGuard",
        {"CHECKPOINT_V92_EMPTY_GUARD"}, {},
        {"shouldTreatAsSilence", "isPunctuationOnly", "isFillerOnly"}));
    bindings.push_back(binding("node.silenceHandler",
        {"SILENCE_HANDLER"}, {"SILENCE_HANDLER"},
        {"SILENCE_DETERMINISTIC"}));

    bindings.push_back(binding("node.slotExtraction",
        {"CHECKPOINT_8"}, {},
        {"Extracting slots", "SLOTS_EXTRACTED"},
        {"SLOTS_EXTRACTED"}));

    bindings.push_back(binding("node.bookingModeCheck",
        {"CHECKPOINT_BRANCH_DECISION"}, {},
        {"bookingModeLocked", "checkpointC_branchDecision"}));
    bindings.push_back(binding("node.bookingRunner",
        {"CHECKPOINT_9b", "checkpointD_bookingRunner"}, {"BOOKING_SNAP", "BOOKING_FLOW_RUNNER"},
        {"BookingFlowRunner"}));

    bindings.push_back(binding("node.directBookingIntentDetector",
        {"CHECKPOINT_DIRECT_INTENT"}, {},
        {"DirectBookingIntentDetector", "hasDirectIntent"}));
    bindings.push_back(binding("node.consentGate",
        {"CHECKPOINT_CONSENT_CHECK"}, {},
        {"shouldEnterBooking", "consentCheck.hasConsent"}));
    bindings.push_back(binding("node.bookingTrigger",
        {"CHECKPOINT_BOOKING_TRIGGER"}, {},
        {"bookingModeLocked = true", "BOOKING MODE TRIGGERED"}));

    bindings.push_back(binding("node.fastPathIntentDetector",
        {"CHECKPOINT_9d_1"}, {},
        {"fastPathTriggered", "fastPathKeywords"}));
    bindings.push_back(binding("node.fastPathOffer",
        {"FAST_PATH_OFFER"}, {"FAST_PATH_BOOKING"},
        {"FAST-PATH ACTIVATED"}));

    bindings.push_back(binding("node.discoveryClarification",
        {"CHECKPOINT_V92_CLARIFY"}, {},
        {"clarifyingQuestion", "vaguePatterns"}));

    bindings.push_back(binding("node.scenarioMatcher",
        {"CHECKPOINT_SCENARIO_MATCH"}, {"SCENARIO_MATCH"},
        {"HybridScenarioSelector", "scenarioRetrieval"}));
    // STATE_MACHINE and RULE_BASED are zero-token deterministic replies
    bindings.push_back(binding("node.scenarioResponse",
        {"SCENARIO_RESPONSE"}, {"SCENARIO_MATCHED", "STATE_MACHINE", "RULE_BASED"},
        {"scenarioMatched", "fromStateMachine"}));

    bindings.push_back(binding("node.llmFallback",
        {"CHECKPOINT_9e"}, {"LLM_FALLBACK", "TIER3_FALLBACK"},
        {"HybridReceptionistLLM", "tier3"}));

    bindings.push_back(binding("node.metaIntentDetector",
        {"CHECKPOINT_V86_META"}, {"META_INTENT_TIER1"},
        {"metaIntentCheck", "META_INTENT"}));

    bindings.push_back(binding("node.bookingComplete",
        {"BOOKING_COMPLETE"}, {"BOOKING_COMPLETE"},
        {"booking finalized", "allSlotsCollected"},
        {"BOOKING_CREATED", "BOOKING_COMPLETE"}));

    return bindings;
}

} // namespace

FlowDefinition default_flow_definition() {
    FlowDefinition def;
    def.version = kFlowTreeVersion;
    def.entry_node_id = kEntryNodeId;
    def.exit_node_id = kExitNodeId;
    def.nodes = build_nodes();
    def.edges = build_edges();
    def.bindings = build_bindings();
    return def;
}

const FlowGraph& default_flow_graph() {
    static const FlowGraph graph(default_flow_definition());
    return graph;
}

} // namespace flow
} // namespace callroute
