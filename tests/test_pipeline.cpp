#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "augment/augmenter.hpp"
#include "fake_transport.hpp"
#include "knowledge/memory_store.hpp"
#include "pipeline/escalation.hpp"
#include "pipeline/models.hpp"
#include "pipeline/research.hpp"
#include "pipeline/response.hpp"
#include "pipeline/text.hpp"
#include "pipeline/triage.hpp"

using namespace swarm;
using namespace swarm::pipeline;
using swarm::augment::FunctionAugmenter;
using swarm::augment::NullAugmenter;
using swarm::test_support::FakeTransport;
using swarm::test_support::make_client;
using swarm::test_support::RecordedCall;

namespace {

TicketRequest make_ticket(const std::string &message, const std::string &id = "T-100") {
  TicketRequest ticket;
  ticket.ticket_id = id;
  ticket.customer_name = "Dana";
  ticket.company = "Acme";
  ticket.message = message;
  return ticket;
}

TriageResult triage_of(Urgency urgency) {
  TriageResult triage;
  triage.urgency = urgency;
  triage.sla_target_minutes = sla_minutes(urgency);
  return triage;
}

// List returns `tools`; describe and invoke always succeed, invoke echoes the tool name
std::shared_ptr<FakeTransport> tool_server(const json &tools) {
  auto transport = std::make_shared<FakeTransport>();
  transport->on_json("GET", "/tools", json{{"tools", tools}});
  transport->on_json("POST", "/tools/describe", json{{"ok", true}});
  transport->on("POST", "/tools/invoke", [](const RecordedCall &call) {
    net::HttpResponse resp;
    resp.status_code = 200;
    resp.body = json{{"echo", call.body["name"]}}.dump();
    return resp;
  });
  return transport;
}

std::vector<RecordedCall> calls_to(const FakeTransport &transport, const std::string &path) {
  std::vector<RecordedCall> out;
  for (const auto &call : transport.calls()) {
    if (call.path == path) out.push_back(call);
  }
  return out;
}

FunctionAugmenter fixed_augmenter(const std::string &text) {
  return FunctionAugmenter([text](const std::string &, const std::string &, const std::string &) {
    return std::optional<std::string>(text);
  });
}

FunctionAugmenter throwing_augmenter() {
  return FunctionAugmenter([](const std::string &, const std::string &, const std::string &) -> std::optional<std::string> {
    throw std::runtime_error("model unavailable");
  });
}

}  // namespace

// ============================================================
// TicketRequest 校验
// ============================================================

TEST(TicketRequestTest, ValidMinimal) {
  auto ticket = TicketRequest::from_json(
      json{{"ticket_id", "T-1"}, {"customer_name", "Dana"}, {"company", "Acme"}, {"message", "Cannot login since 9am"}});

  ASSERT_TRUE(ticket.ok()) << ticket.error.value_or("");
  EXPECT_EQ(ticket.value->preferred_tone, Tone::Friendly);
  EXPECT_FALSE(ticket.value->urgency_hint.has_value());
  EXPECT_TRUE(ticket.value->metadata.is_object());
}

TEST(TicketRequestTest, OptionalFields) {
  auto ticket = TicketRequest::from_json(json{{"ticket_id", "T-1"},
                                              {"customer_name", "Dana"},
                                              {"company", "Acme"},
                                              {"message", "Refund for duplicate charge"},
                                              {"preferred_tone", "formal"},
                                              {"urgency_hint", "urgent"},
                                              {"metadata", {{"plan", "enterprise"}}}});

  ASSERT_TRUE(ticket.ok());
  EXPECT_EQ(ticket.value->preferred_tone, Tone::Formal);
  EXPECT_EQ(ticket.value->urgency_hint, "urgent");
  EXPECT_EQ(ticket.value->metadata["plan"], "enterprise");
}

TEST(TicketRequestTest, MessageTooShort) {
  auto ticket = TicketRequest::from_json(json{{"ticket_id", "T-1"}, {"customer_name", "D"}, {"company", "A"}, {"message", "help"}});

  ASSERT_FALSE(ticket.ok());
  EXPECT_NE(ticket.error->find("message"), std::string::npos);
}

TEST(TicketRequestTest, MessageLengthCountsCharacters) {
  json base = {{"ticket_id", "T-1"}, {"customer_name", "D"}, {"company", "A"}};

  // 4 个汉字，12 字节
  auto short_ticket = base;
  short_ticket["message"] = "\xE7\xB4\xA7\xE6\x80\xA5\xE9\x97\xAE\xE9\xA2\x98";
  EXPECT_FALSE(TicketRequest::from_json(short_ticket).ok());

  // 8 个汉字
  auto long_ticket = base;
  long_ticket["message"] = "\xE7\xB4\xA7\xE6\x80\xA5\xE9\x97\xAE\xE9\xA2\x98\xE7\xB4\xA7\xE6\x80\xA5\xE9\x97\xAE\xE9\xA2\x98";
  EXPECT_TRUE(TicketRequest::from_json(long_ticket).ok());
}

TEST(TicketRequestTest, RejectsBadFields) {
  json base = {{"ticket_id", "T-1"}, {"customer_name", "Dana"}, {"company", "Acme"}, {"message", "Long enough message"}};

  auto no_id = base;
  no_id.erase("ticket_id");
  EXPECT_FALSE(TicketRequest::from_json(no_id).ok());

  auto empty_id = base;
  empty_id["ticket_id"] = "";
  EXPECT_FALSE(TicketRequest::from_json(empty_id).ok());

  auto bad_tone = base;
  bad_tone["preferred_tone"] = "sarcastic";
  EXPECT_FALSE(TicketRequest::from_json(bad_tone).ok());

  auto bad_meta = base;
  bad_meta["metadata"] = "x";
  EXPECT_FALSE(TicketRequest::from_json(bad_meta).ok());

  EXPECT_FALSE(TicketRequest::from_json(json::array()).ok());
}

TEST(ModelsTest, FormatTimestamp) {
  auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1714564800)) + std::chrono::microseconds(42);

  EXPECT_EQ(format_timestamp(tp), "2024-05-01T12:00:00.000042Z");
}

TEST(ModelsTest, EscalationJson) {
  EscalationDecision decision;
  decision.escalate = true;
  decision.route_to = RouteTarget::BillingSpecialist;
  decision.reason = "r";
  json j = decision;

  EXPECT_EQ(j["route_to"], "billing_specialist");
  EXPECT_EQ(j["escalate"], true);
  EXPECT_TRUE(j["tool_actions"].is_array());
}

// ============================================================
// Text helpers
// ============================================================

TEST(TextTest, TruncateUtf8CountsCharacters) {
  std::string text = "ab\xC3\xA9z";  // "abéz"

  EXPECT_EQ(truncate_utf8(text, 2), "ab");
  EXPECT_EQ(truncate_utf8(text, 3), "ab\xC3\xA9");
  EXPECT_EQ(truncate_utf8(text, 4), text);
  EXPECT_EQ(truncate_utf8(text, 10), text);
}

TEST(TextTest, TruncateUtf8MultiByteText) {
  std::string han;
  for (int i = 0; i < 200; ++i) han += "\xE4\xB8\xAD";  // 中

  auto cut = truncate_utf8(han, 160);

  EXPECT_EQ(utf8_length(cut), 160u);
  EXPECT_EQ(cut.size(), 480u);
  EXPECT_EQ(utf8_length("\xE7\xB4\xA7\xE6\x80\xA5"), 2u);
}

TEST(TextTest, ContainsAny) {
  EXPECT_TRUE(contains_any("we cannot login today", {"blocked", "cannot login"}));
  EXPECT_FALSE(contains_any("all good", {"outage"}));
}

// ============================================================
// TriageStage
// ============================================================

TEST(TriageStageTest, TiersInOrder) {
  NullAugmenter none;
  TriageStage stage(none);

  auto critical = stage.run(make_ticket("Possible security breach on our tenant"));
  EXPECT_EQ(critical.urgency, Urgency::Critical);
  EXPECT_EQ(critical.sla_target_minutes, 15);
  EXPECT_DOUBLE_EQ(critical.confidence, 0.90);

  auto high = stage.run(make_ticket("We cannot login to the dashboard"));
  EXPECT_EQ(high.urgency, Urgency::High);
  EXPECT_EQ(high.sla_target_minutes, 60);
  EXPECT_DOUBLE_EQ(high.confidence, 0.82);

  auto medium = stage.run(make_ticket("Question about last month's invoice"));
  EXPECT_EQ(medium.urgency, Urgency::Medium);
  EXPECT_EQ(medium.sla_target_minutes, 240);
  EXPECT_DOUBLE_EQ(medium.confidence, 0.78);

  auto low = stage.run(make_ticket("How can I change my avatar picture?"));
  EXPECT_EQ(low.urgency, Urgency::Low);
  EXPECT_EQ(low.sla_target_minutes, 1440);
  EXPECT_DOUBLE_EQ(low.confidence, 0.70);
  EXPECT_EQ(low.reason, "General support request with no outage indicators.");
}

TEST(TriageStageTest, HigherTierWins) {
  NullAugmenter none;
  TriageStage stage(none);

  // 同时包含 billing 与 outage 关键词，应取最高级
  auto result = stage.run(make_ticket("Billing portal outage, refund needed"));
  EXPECT_EQ(result.urgency, Urgency::Critical);
}

TEST(TriageStageTest, UrgencyHintIsConsidered) {
  NullAugmenter none;
  TriageStage stage(none);

  auto ticket = make_ticket("Please update my shipping address");
  ticket.urgency_hint = "URGENT";

  EXPECT_EQ(stage.run(ticket).urgency, Urgency::High);
}

TEST(TriageStageTest, AugmentationOnlyAppendsNote) {
  auto augmenter = fixed_augmenter(std::string(400, 'x'));
  TriageStage stage(augmenter);

  auto result = stage.run(make_ticket("How can I change my avatar picture?"));

  EXPECT_EQ(result.urgency, Urgency::Low);
  EXPECT_DOUBLE_EQ(result.confidence, 0.70);
  std::string expected = "General support request with no outage indicators. Model note: " + std::string(160, 'x');
  EXPECT_EQ(result.reason, expected);
}

TEST(TriageStageTest, AugmentationNoteCountsCharacters) {
  std::string han;
  for (int i = 0; i < 200; ++i) han += "\xE4\xB8\xAD";  // 中
  auto augmenter = fixed_augmenter(han);
  TriageStage stage(augmenter);

  auto result = stage.run(make_ticket("How can I change my avatar picture?"));

  std::string marker = " Model note: ";
  auto pos = result.reason.find(marker);
  ASSERT_NE(pos, std::string::npos);
  EXPECT_EQ(utf8_length(result.reason.substr(pos + marker.size())), 160u);
}

TEST(TriageStageTest, FailingAugmenterIsIgnored) {
  auto augmenter = throwing_augmenter();
  TriageStage stage(augmenter);

  auto result = stage.run(make_ticket("Major outage in EU region"));

  EXPECT_EQ(result.urgency, Urgency::Critical);
  EXPECT_EQ(result.reason, "Possible service or security incident detected.");
}

// ============================================================
// ResearchStage
// ============================================================

TEST(ResearchStageTest, NoNotesDisabledGateway) {
  knowledge::MemoryKnowledgeStore store;
  NullAugmenter none;
  gateway::ToolGatewayClient disabled(gateway::GatewayOptions{}, std::make_shared<FakeTransport>());
  ResearchStage stage(store, disabled, none);

  auto result = stage.run(make_ticket("Something odd with widgets"), triage_of(Urgency::Low));

  EXPECT_TRUE(result.retrieved_notes.empty());
  EXPECT_TRUE(result.web_lookup_needed);
  EXPECT_TRUE(result.tool_actions.empty());
  EXPECT_EQ(result.synthesis, ResearchStage::kDefaultSynthesis);
}

TEST(ResearchStageTest, LocalCoverageSkipsWebLookup) {
  knowledge::MemoryKnowledgeStore store;
  store.add("a", "Invoice corrections need a billing ticket.", "billing-policy");
  store.add("b", "Refund invoice requests take five days.", "finance");
  auto transport = tool_server(json::array({{{"name", "web_search"}}}));
  auto client = make_client(transport);
  NullAugmenter none;
  ResearchStage stage(store, client, none);

  auto result = stage.run(make_ticket("Wrong invoice amount"), triage_of(Urgency::Medium));

  ASSERT_EQ(result.retrieved_notes.size(), 2u);
  EXPECT_EQ(result.retrieved_notes[0], "[billing-policy] Invoice corrections need a billing ticket.");
  EXPECT_FALSE(result.web_lookup_needed);
  EXPECT_TRUE(result.tool_actions.empty());
  EXPECT_TRUE(transport->calls().empty());
  EXPECT_EQ(result.synthesis, "Invoice corrections need a billing ticket. Refund invoice requests take five days.");
}

TEST(ResearchStageTest, WebLookupDescribesThenInvokes) {
  knowledge::MemoryKnowledgeStore store;
  auto transport = tool_server(json::array({{{"name", "calculator"}}, {{"name", "web_search"}, {"description", "Search the web"}}}));
  auto client = make_client(transport);
  NullAugmenter none;
  ResearchStage stage(store, client, none);

  auto ticket = make_ticket("Strange widget rendering glitch", "T-7");
  auto result = stage.run(ticket, triage_of(Urgency::Low));

  EXPECT_TRUE(result.web_lookup_needed);
  ASSERT_EQ(result.tool_actions.size(), 1u);
  EXPECT_EQ(result.tool_actions[0], "Invoked tool: web_search");
  ASSERT_EQ(result.retrieved_notes.size(), 1u);
  EXPECT_EQ(result.retrieved_notes[0].rfind("[tool:web_search] ", 0), 0u);

  EXPECT_EQ(transport->paths(), (std::vector<std::string>{"/tools", "/tools/describe", "/tools/invoke"}));
  auto invokes = calls_to(*transport, "/tools/invoke");
  ASSERT_EQ(invokes.size(), 1u);
  EXPECT_EQ(invokes[0].body["arguments"]["query"], ticket.message);
  EXPECT_EQ(invokes[0].body["arguments"]["ticket_id"], "T-7");
}

TEST(ResearchStageTest, ToolNoteIsTruncated) {
  knowledge::MemoryKnowledgeStore store;
  auto transport = std::make_shared<FakeTransport>();
  transport->on_json("GET", "/tools", json{{"tools", {{{"name", "web_search"}}}}});
  transport->on_json("POST", "/tools/describe", json{{"ok", true}});
  transport->on_json("POST", "/tools/invoke", json{{"text", std::string(1000, 'y')}});
  auto client = make_client(transport);
  NullAugmenter none;
  ResearchStage stage(store, client, none);

  auto result = stage.run(make_ticket("Strange widget rendering glitch"), triage_of(Urgency::Low));

  ASSERT_EQ(result.retrieved_notes.size(), 1u);
  EXPECT_EQ(result.retrieved_notes[0].size(), std::string("[tool:web_search] ").size() + ResearchStage::kMaxToolNoteLength);
}

TEST(ResearchStageTest, ToolFailureIsSkipped) {
  knowledge::MemoryKnowledgeStore store;
  auto transport = std::make_shared<FakeTransport>();
  transport->on_json("GET", "/tools", json{{"tools", {{{"name", "web_search"}}}}});
  transport->on_json("POST", "/tools/describe", json{{"ok", true}});
  // invoke 的所有约定都失败
  auto client = make_client(transport);
  NullAugmenter none;
  ResearchStage stage(store, client, none);

  auto result = stage.run(make_ticket("Strange widget rendering glitch"), triage_of(Urgency::Low));

  EXPECT_TRUE(result.retrieved_notes.empty());
  EXPECT_TRUE(result.tool_actions.empty());
  EXPECT_EQ(result.synthesis, ResearchStage::kDefaultSynthesis);
}

TEST(ResearchStageTest, EmptyToolResultIsNoAction) {
  knowledge::MemoryKnowledgeStore store;
  auto transport = std::make_shared<FakeTransport>();
  transport->on_json("GET", "/tools", json{{"tools", {{{"name", "web_search"}}}}});
  transport->on_json("POST", "/tools/describe", json{{"ok", true}});
  transport->on_json("POST", "/tools/invoke", json::object());
  auto client = make_client(transport);
  NullAugmenter none;
  ResearchStage stage(store, client, none);

  auto result = stage.run(make_ticket("Strange widget rendering glitch"), triage_of(Urgency::Low));

  EXPECT_EQ(transport->count("/tools/invoke"), 1u);
  EXPECT_TRUE(result.retrieved_notes.empty());
  EXPECT_TRUE(result.tool_actions.empty());
}

TEST(ResearchStageTest, DescribeFailureSkipsInvoke) {
  knowledge::MemoryKnowledgeStore store;
  auto transport = std::make_shared<FakeTransport>();
  transport->on_json("GET", "/tools", json{{"tools", {{{"name", "web_search"}}}}});
  transport->on_json("POST", "/tools/invoke", json{{"ok", true}});
  auto client = make_client(transport);
  NullAugmenter none;
  ResearchStage stage(store, client, none);

  auto result = stage.run(make_ticket("Strange widget rendering glitch"), triage_of(Urgency::Low));

  EXPECT_TRUE(result.tool_actions.empty());
  EXPECT_EQ(transport->count("/tools/invoke"), 0u);
}

TEST(ResearchStageTest, AugmentedSynthesisIsTruncated) {
  knowledge::MemoryKnowledgeStore store;
  store.seed_default();
  gateway::ToolGatewayClient disabled(gateway::GatewayOptions{}, std::make_shared<FakeTransport>());
  auto augmenter = fixed_augmenter(std::string(900, 's'));
  ResearchStage stage(store, disabled, augmenter);

  auto result = stage.run(make_ticket("Password reset keeps failing"), triage_of(Urgency::Low));

  EXPECT_EQ(result.synthesis, std::string(500, 's'));
  ASSERT_FALSE(result.retrieved_notes.empty());
  EXPECT_EQ(result.retrieved_notes[0].rfind("[playbook] ", 0), 0u);
}

// ============================================================
// ResponseStage
// ============================================================

TEST(ResponseStageTest, TemplateDraft) {
  NullAugmenter none;
  ResponseStage stage(none);
  ResearchResult research;
  research.synthesis = "Clear the SSO cache.";

  auto draft = stage.run(make_ticket("We cannot login at all", "T-42"), triage_of(Urgency::High), research);

  EXPECT_EQ(draft.subject, "[HIGH] Update on ticket T-42");
  EXPECT_EQ(draft.message.rfind("Hi Dana,", 0), 0u);
  EXPECT_NE(draft.message.find("**high**"), std::string::npos);
  EXPECT_NE(draft.message.find("60 minutes"), std::string::npos);
  EXPECT_NE(draft.message.find("Clear the SSO cache."), std::string::npos);
  EXPECT_NE(draft.message.find("Best,\nSupport Swarm"), std::string::npos);
  EXPECT_EQ(draft.suggested_actions, default_suggested_actions());
  EXPECT_EQ(draft.suggested_actions.size(), 4u);
}

TEST(ResponseStageTest, AugmentedDraftKeepsSubject) {
  auto augmenter = fixed_augmenter(std::string(1500, 'm'));
  ResponseStage stage(augmenter);

  auto draft = stage.run(make_ticket("Outage everywhere", "T-9"), triage_of(Urgency::Critical), ResearchResult{});

  EXPECT_EQ(draft.subject, "[CRITICAL] Update on ticket T-9");
  EXPECT_EQ(draft.message, std::string(1000, 'm'));
  EXPECT_EQ(draft.suggested_actions.size(), 4u);
}

TEST(ResponseStageTest, ToneReachesPrompt) {
  std::string seen_prompt;
  FunctionAugmenter augmenter([&](const std::string &, const std::string &, const std::string &prompt) -> std::optional<std::string> {
    seen_prompt = prompt;
    return std::nullopt;
  });
  ResponseStage stage(augmenter);

  auto ticket = make_ticket("Need an invoice copy");
  ticket.preferred_tone = Tone::Direct;
  stage.run(ticket, triage_of(Urgency::Medium), ResearchResult{});

  EXPECT_NE(seen_prompt.find(tone_style(Tone::Direct)), std::string::npos);
  EXPECT_NE(seen_prompt.find("Dana"), std::string::npos);
}

// ============================================================
// EscalationStage
// ============================================================

TEST(EscalationStageTest, RoutingTable) {
  gateway::ToolGatewayClient disabled(gateway::GatewayOptions{}, std::make_shared<FakeTransport>());
  EscalationStage stage(disabled);

  auto security = stage.run(make_ticket("Suspected breach of admin account"), triage_of(Urgency::Critical));
  EXPECT_TRUE(security.escalate);
  EXPECT_EQ(security.route_to, RouteTarget::SecuritySpecialist);

  auto billing = stage.run(make_ticket("Urgent: invoice charged twice"), triage_of(Urgency::High));
  EXPECT_TRUE(billing.escalate);
  EXPECT_EQ(billing.route_to, RouteTarget::BillingSpecialist);

  auto billing_medium = stage.run(make_ticket("Question about invoice"), triage_of(Urgency::Medium));
  EXPECT_FALSE(billing_medium.escalate);
  EXPECT_EQ(billing_medium.route_to, RouteTarget::None);

  auto critical = stage.run(make_ticket("Total outage in production"), triage_of(Urgency::Critical));
  EXPECT_TRUE(critical.escalate);
  EXPECT_EQ(critical.route_to, RouteTarget::HumanSupportLead);

  auto low = stage.run(make_ticket("Where can I find the docs?"), triage_of(Urgency::Low));
  EXPECT_FALSE(low.escalate);
  EXPECT_EQ(low.route_to, RouteTarget::None);
  EXPECT_EQ(low.reason, "Autonomous resolution path is acceptable.");
  EXPECT_TRUE(low.tool_actions.empty());
}

TEST(EscalationStageTest, SecurityBeatsBilling) {
  gateway::ToolGatewayClient disabled(gateway::GatewayOptions{}, std::make_shared<FakeTransport>());
  EscalationStage stage(disabled);

  auto decision = stage.run(make_ticket("Security issue with our billing refund"), triage_of(Urgency::Critical));

  EXPECT_EQ(decision.route_to, RouteTarget::SecuritySpecialist);
}

TEST(EscalationStageTest, DisabledGatewayNoActions) {
  gateway::ToolGatewayClient disabled(gateway::GatewayOptions{}, std::make_shared<FakeTransport>());
  EscalationStage stage(disabled);

  auto decision = stage.run(make_ticket("Total outage in production"), triage_of(Urgency::Critical));

  EXPECT_TRUE(decision.escalate);
  EXPECT_TRUE(decision.tool_actions.empty());
}

TEST(EscalationStageTest, UpdatesTicketAndNotifies) {
  auto transport = tool_server(json::array({{{"name", "crm_update"}, {"description", "Update a ticket"}},
                                            {{"name", "notify_email"}, {"description", "Send an email"}}}));
  auto client = make_client(transport);
  EscalationStage stage(client, "oncall@example.com");

  auto decision = stage.run(make_ticket("Suspected breach of admin account", "T-55"), triage_of(Urgency::Critical));

  EXPECT_EQ(decision.route_to, RouteTarget::SecuritySpecialist);
  EXPECT_EQ(decision.tool_actions, (std::vector<std::string>{"Invoked tool: crm_update", "Invoked tool: notify_email"}));

  auto invokes = calls_to(*transport, "/tools/invoke");
  ASSERT_EQ(invokes.size(), 2u);
  EXPECT_EQ(invokes[0].body["name"], "crm_update");
  EXPECT_EQ(invokes[0].body["arguments"], json({{"ticket_id", "T-55"}, {"status", "escalated"}, {"route_to", "security_specialist"}}));
  EXPECT_EQ(invokes[1].body["name"], "notify_email");
  EXPECT_EQ(invokes[1].body["arguments"]["to"], "oncall@example.com");
  EXPECT_EQ(invokes[1].body["arguments"]["subject"], "Escalation required for T-55");
}

TEST(EscalationStageTest, MissingNotificationToolStillUpdatesTicket) {
  auto transport = tool_server(json::array({{{"name", "ticket_db"}}}));
  auto client = make_client(transport);
  EscalationStage stage(client);

  auto decision = stage.run(make_ticket("Total outage in production"), triage_of(Urgency::Critical));

  EXPECT_EQ(decision.tool_actions, (std::vector<std::string>{"Invoked tool: ticket_db"}));
}

TEST(EscalationStageTest, EmptyToolResultsAreNotActions) {
  auto transport = std::make_shared<FakeTransport>();
  transport->on_json("GET", "/tools", json{{"tools", {{{"name", "crm_update"}}, {{"name", "notify_email"}}}}});
  transport->on_json("POST", "/tools/describe", json{{"ok", true}});
  transport->on_json("POST", "/tools/invoke", json::object());
  auto client = make_client(transport);
  EscalationStage stage(client);

  auto decision = stage.run(make_ticket("Total outage in production"), triage_of(Urgency::Critical));

  EXPECT_TRUE(decision.escalate);
  EXPECT_EQ(transport->count("/tools/invoke"), 2u);
  EXPECT_TRUE(decision.tool_actions.empty());
}

TEST(EscalationStageTest, EscalateMatchesRoute) {
  gateway::ToolGatewayClient disabled(gateway::GatewayOptions{}, std::make_shared<FakeTransport>());
  EscalationStage stage(disabled);

  const std::vector<std::string> messages = {"Suspected breach", "Refund for invoice", "Total outage", "Hello there friend"};
  for (const auto &message : messages) {
    for (auto urgency : {Urgency::Low, Urgency::Medium, Urgency::High, Urgency::Critical}) {
      auto decision = stage.run(make_ticket(message), triage_of(urgency));
      EXPECT_EQ(decision.escalate, decision.route_to != RouteTarget::None) << message << " / " << to_string(urgency);
    }
  }
}
