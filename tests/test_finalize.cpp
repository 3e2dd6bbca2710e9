#include "test_framework.hpp"

#include "sessionflow/finalize/checklist.hpp"
#include "sessionflow/finalize/engine.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace finalize = sessionflow::finalize;
namespace gateway = sessionflow::gateway;
namespace session = sessionflow::session;
using sessionflow::testing::FakeGateway;
using sessionflow::testing::TempWorkspace;

constexpr const char *kParentBody = R"(## Billing rollout

- [x] Phase 1: schema #47
- [x] Phase 2: import #48
- [x] Phase 3: export #49
- [ ] Phase 4: invoices #51
- [ ] Phase 5: reminders #52
- [ ] Phase 6: cleanup #53
)";

constexpr const char *kPhaseLedger = "# Tasks\n- [x] T010 Model\n- [ ] T011 Totals\n- [ ] T012 PDF\n";

gateway::PullRequest merged_pr(const std::uint64_t number, const bool draft = false) {
  gateway::PullRequest pr;
  pr.number = number;
  pr.state = "closed";
  pr.merged = true;
  pr.draft = draft;
  pr.body = "Implements the change.\n";
  pr.url = "https://github.com/acme/widgets/pull/" + std::to_string(number);
  return pr;
}

gateway::Issue open_issue(const std::uint64_t number, std::string body = "") {
  return gateway::Issue{.number = number, .state = "open", .title = "", .body = std::move(body)};
}

struct IssueFixture {
  FakeGateway gateway;
  TempWorkspace workspace;
  finalize::FinalizeContext context;

  IssueFixture() {
    gateway.prs[7] = merged_pr(7);
    gateway.issues[42] = open_issue(42);

    context.session.session_id = "2025-01-31-1";
    context.session.details = session::GithubIssueDetails{.issue_number = 42, .issue_title = ""};
    context.session.pr_number = 7;
    context.session.touched_tasks = {"T001"};
    context.session_dir = workspace.path() / "session";
    context.specs_dir = workspace.path() / "specs";
    workspace.create_file("session/tasks.md", "- [ ] T001 Fix crash\n- [ ] T002 Add test\n");
  }
};

struct PhaseFixture {
  FakeGateway gateway;
  TempWorkspace workspace;
  finalize::FinalizeContext context;

  PhaseFixture() {
    gateway.prs[60] = merged_pr(60, true);
    gateway.issues[51] = open_issue(51);
    gateway.issues[50] = open_issue(50, kParentBody);

    context.session.session_id = "2025-03-14-2";
    context.session.details = session::SpeckitDetails{.phase_issue = 51,
                                                      .parent_issue = 50,
                                                      .feature_id = "007-billing",
                                                      .spec_dir = "specs/007-billing"};
    context.session.pr_number = 60;
    context.session.touched_tasks = {"T011", "T012"};
    context.session_dir = workspace.path() / "session";
    context.specs_dir = workspace.path() / "specs";
    workspace.create_file("specs/007-billing/tasks.md", kPhaseLedger);
  }
};

bool has_warning(const finalize::FinalizeResult &result, const std::string &needle) {
  for (const auto &warning : result.warnings) {
    if (warning.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_finalize_tests(std::vector<sessionflow::tests::TestCase> &tests) {
  using sessionflow::tests::require;

  tests.push_back({"checklist_progress_counts_lines", [] {
                     const auto progress = finalize::checklist_progress(kParentBody);
                     require(progress.total == 6 && progress.complete == 3, "3 of 6");
                     require(progress.text() == "3/6 phases complete", progress.text());
                     require(!progress.all_complete(), "not complete");
                     require(!finalize::checklist_progress("no list").all_complete(),
                             "empty checklist is never complete");
                   }});

  tests.push_back({"checklist_progress_ignores_unreferenced_boxes", [] {
                     const std::string body = "## Phases\n- [x] Phase 1 #47\n- [x] Phase 2 #48\n"
                                              "## Acceptance\n- [ ] Totals match legacy\n"
                                              "- [ ] Docs updated\n";
                     const auto progress = finalize::checklist_progress(body);
                     require(progress.text() == "2/2 phases complete", progress.text());
                     require(progress.all_complete(), "acceptance boxes do not block");
                   }});

  tests.push_back({"finalize_last_phase_promotes_with_acceptance_list", [] {
                     PhaseFixture fx;
                     fx.gateway.issues[50].body = "- [x] Phase 1 #47\n- [ ] Phase 2 #51\n\n"
                                                  "Acceptance:\n- [ ] Invoices render\n";
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok(), "finalize should succeed");
                     const auto &outcome = std::get<finalize::SpeckitOutcome>(result.outcome);
                     require(outcome.parent_issue.progress == "2/2 phases complete",
                             outcome.parent_issue.progress);
                     require(!outcome.pr.still_draft, "promoted");
                     require(fx.gateway.issues[50].body.find("- [ ] Invoices render") !=
                                 std::string::npos,
                             "acceptance line untouched");
                   }});

  tests.push_back({"check_phase_line_exact_issue", [] {
                     const std::string body = "- [ ] Phase A #5\n- [ ] Phase B #51\n";
                     const auto toggle = finalize::check_phase_line(body, 5);
                     require(toggle.state == finalize::PhaseLineState::Open, "open line");
                     require(toggle.body == "- [x] Phase A #5\n- [ ] Phase B #51\n",
                             "only #5 checked");
                     require(finalize::check_phase_line(toggle.body, 5).state ==
                                 finalize::PhaseLineState::Checked,
                             "second pass sees checked");
                     require(finalize::check_phase_line(body, 9).state ==
                                 finalize::PhaseLineState::Missing,
                             "missing");
                     require(finalize::check_phase_line("- [ ] #5 a\n- [ ] #5 b\n", 5).state ==
                                 finalize::PhaseLineState::Ambiguous,
                             "ambiguous");
                   }});

  tests.push_back({"finalize_github_issue_closes_and_marks", [] {
                     IssueFixture fx;
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok(), result.ok() ? "" : result.failure->error);
                     const auto *outcome = std::get_if<finalize::GithubIssueOutcome>(&result.outcome);
                     require(outcome != nullptr, "issue outcome");
                     require(outcome->issue.closed, "issue closed");
                     require(outcome->issue.comment == std::optional<std::string>("Resolved via PR #7"),
                             "close comment");
                     require(fx.gateway.issues[42].is_closed(), "gateway state");
                     require(result.tasks.marked == 1 && result.tasks.completed == 1 &&
                                 result.tasks.total == 2,
                             "ledger counts");
                     require(fx.workspace.read_file("session/tasks.md") ==
                                 "- [x] T001 Fix crash\n- [ ] T002 Add test\n",
                             "ledger written");
                     require(!result.synced_to_projects, "sync disabled");
                     require(result.ready_for_wrap, "ready for wrap");
                     require(result.warnings.empty(), "no warnings");
                   }});

  tests.push_back({"finalize_github_issue_completes_ledger", [] {
                     IssueFixture fx;
                     fx.context.session.touched_tasks = {"T006", "T007"};
                     fx.workspace.create_file("session/tasks.md",
                                              "# Tasks\n"
                                              "## Issue Context\n"
                                              "- [ ] Export works for empty carts\n"
                                              "- [Design](design.md)\n"
                                              "## Tasks\n"
                                              "- [x] T001 Reproduce\n- [x] T002 Trace\n"
                                              "- [x] T003 Fix\n- [x] T004 Unit test\n"
                                              "- [x] T005 Docs\n- [ ] T006 Review\n"
                                              "- [ ] T007 Release note\n");
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok(), result.ok() ? "" : result.failure->error);
                     require(result.tasks.total == 7 && result.tasks.completed == 7,
                             "7/7 complete");
                     require(result.tasks.marked == 2, "two marked now");
                     const std::string text = fx.workspace.read_file("session/tasks.md");
                     require(text.find("- [ ] Export works for empty carts") != std::string::npos,
                             "issue checklist untouched");
                     require(text.find("- [x] T007 Release note") != std::string::npos, "T007");
                   }});

  tests.push_back({"finalize_github_issue_is_idempotent", [] {
                     IssueFixture fx;
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto first = engine.run(fx.context);
                     require(first.ok(), "first run");
                     const std::size_t mutations = fx.gateway.mutating_calls();
                     const std::string ledger = fx.workspace.read_file("session/tasks.md");

                     const auto second = engine.run(fx.context);
                     require(second.ok(), "second run");
                     require(fx.gateway.mutating_calls() == mutations, "no new mutations");
                     const auto &outcome = std::get<finalize::GithubIssueOutcome>(second.outcome);
                     require(outcome.issue.closed, "still closed");
                     require(!outcome.issue.comment.has_value(), "no second comment");
                     require(second.tasks.marked == 0, "nothing re-marked");
                     require(second.tasks.total == first.tasks.total &&
                                 second.tasks.completed == first.tasks.completed,
                             "counts unchanged");
                     require(fx.workspace.read_file("session/tasks.md") == ledger, "ledger stable");
                   }});

  tests.push_back({"finalize_phase_updates_parent_and_draft", [] {
                     PhaseFixture fx;
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok(), result.ok() ? "" : result.failure->error);
                     const auto *outcome = std::get_if<finalize::SpeckitOutcome>(&result.outcome);
                     require(outcome != nullptr, "speckit outcome");
                     require(outcome->phase_issue.closed, "phase issue closed");
                     require(outcome->parent_issue.updated, "parent body written");
                     require(outcome->parent_issue.checklist_updated, "checklist updated");
                     require(outcome->parent_issue.progress == "4/6 phases complete",
                             outcome->parent_issue.progress);
                     require(outcome->pr.still_draft, "PR stays draft");
                     require(outcome->pr.reason == "2 of 6 phases remaining", outcome->pr.reason);
                     require(outcome->pr.description_updated, "PR note appended");
                     require(fx.gateway.prs[60].body.find(finalize::phase_note_marker(51)) !=
                                 std::string::npos,
                             "marker in PR body");
                     require(fx.gateway.ready_calls == 0, "not promoted");
                     require(result.tasks.marked == 2 && result.tasks.completed == 3,
                             "all phase tasks done");
                   }});

  tests.push_back({"finalize_parent_patch_is_local", [] {
                     PhaseFixture fx;
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok(), "finalize should succeed");
                     const std::string before = kParentBody;
                     const std::string &after = fx.gateway.issues[50].body;
                     require(before.size() == after.size(), "length preserved");
                     std::size_t differences = 0;
                     for (std::size_t i = 0; i < before.size(); ++i) {
                       differences += before[i] != after[i] ? 1 : 0;
                     }
                     require(differences == 1, "exactly one byte changes");
                     require(after.find("- [x] Phase 4: invoices #51") != std::string::npos,
                             "phase line checked");
                   }});

  tests.push_back({"finalize_unmerged_pr_makes_no_changes", [] {
                     PhaseFixture fx;
                     fx.gateway.prs[60].merged = false;
                     fx.gateway.prs[60].state = "open";
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(!result.ok(), "unmerged PR must fail");
                     require(result.failure->error == "PR not merged", result.failure->error);
                     require(result.failure->message ==
                                 "Merge PR #60 first, then retry sessionflow finalize",
                             result.failure->message);
                     require(result.failure->pr.has_value() && result.failure->pr->state == "open",
                             "PR snapshot");
                     require(fx.gateway.mutating_calls() == 0, "no mutations");
                     require(fx.workspace.read_file("specs/007-billing/tasks.md") == kPhaseLedger,
                             "ledger untouched");
                     require(result.to_json().find("\"status\": \"error\"") != std::string::npos,
                             "error json");
                   }});

  tests.push_back({"finalize_missing_pr_reports_not_found", [] {
                     IssueFixture fx;
                     fx.gateway.prs.clear();
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(!result.ok(), "missing PR must fail");
                     require(result.failure->pr.has_value() &&
                                 result.failure->pr->state == "not_found",
                             "not_found snapshot");
                   }});

  tests.push_back({"finalize_pr_fetch_error", [] {
                     IssueFixture fx;
                     fx.gateway.pr_fetch_error = gateway::GatewayError{
                         .code = gateway::GatewayErrorCode::NetworkError,
                         .status = 0,
                         .resource = "pull request #7",
                         .message = "connection reset"};
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(!result.ok() && result.failure->error == "PR fetch failed",
                             "fetch failure");
                   }});

  tests.push_back({"finalize_unstructured_finds_pr_by_branch", [] {
                     FakeGateway gateway;
                     TempWorkspace workspace;
                     gateway.prs[12] = merged_pr(12);
                     gateway.branch_prs["chore/cleanup"] = 12;
                     finalize::FinalizeContext context;
                     context.session.session_id = "2025-04-01-1";
                     context.session.details = session::UnstructuredDetails{.goal = "cleanup"};
                     context.session.touched_tasks = {"T1"};
                     context.session_dir = workspace.path() / "session";
                     context.branch = "chore/cleanup";

                     finalize::FinalizeEngine engine(gateway);
                     const auto result = engine.run(context);
                     require(result.ok(), result.ok() ? "" : result.failure->error);
                     require(result.pr_number == 12, "PR from branch lookup");
                     require(!result.tasks.found, "no ledger");
                     require(has_warning(result, "not found"), "missing ledger warning");
                     require(result.to_json().find("\"pr_number\": 12") != std::string::npos,
                             "unstructured json carries pr_number");
                   }});

  tests.push_back({"finalize_no_pr_for_branch", [] {
                     FakeGateway gateway;
                     finalize::FinalizeContext context;
                     context.session.session_id = "2025-04-01-1";
                     context.session.details = session::UnstructuredDetails{};
                     context.branch = "feature/none";
                     finalize::FinalizeEngine engine(gateway);
                     const auto result = engine.run(context);
                     require(!result.ok(), "no PR should fail");
                     require(result.failure->error == "No PR found for current branch",
                             result.failure->error);
                   }});

  tests.push_back({"finalize_invalid_session", [] {
                     FakeGateway gateway;
                     finalize::FinalizeContext context;
                     context.session.session_id = "2025-04-01-1";
                     context.session.details = session::SpeckitDetails{
                         .phase_issue = 3, .parent_issue = std::nullopt, .feature_id = "x",
                         .spec_dir = ""};
                     finalize::FinalizeEngine engine(gateway);
                     const auto result = engine.run(context);
                     require(!result.ok() && result.failure->error == "Invalid session",
                             "invalid session");
                     require(gateway.mutating_calls() == 0, "no mutations");
                   }});

  tests.push_back({"finalize_parent_conflict_is_warning", [] {
                     PhaseFixture fx;
                     fx.gateway.conflicting_issue_bodies.insert(50);
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok(), "conflict must not fail finalize");
                     const auto &outcome = std::get<finalize::SpeckitOutcome>(result.outcome);
                     require(!outcome.parent_issue.updated, "parent not written");
                     require(!outcome.parent_issue.checklist_updated, "checklist not updated");
                     require(has_warning(result, "parent issue #50"), "conflict warning");
                     require(fx.gateway.issues[50].body == kParentBody, "parent untouched");
                     require(result.tasks.marked == 2 && result.tasks.completed == 3 &&
                                 result.tasks.total == 3,
                             "ledger still marked");
                     require(fx.workspace.read_file("specs/007-billing/tasks.md") ==
                                 "# Tasks\n- [x] T010 Model\n- [x] T011 Totals\n- [x] T012 PDF\n",
                             "ledger written despite conflict");
                   }});

  tests.push_back({"finalize_missing_phase_line_is_warning", [] {
                     PhaseFixture fx;
                     fx.gateway.issues[50].body = "- [x] Phase 1 #47\n";
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok(), "missing phase line must not fail");
                     require(has_warning(result, "no checklist line for #51"), "warning");
                     require(fx.gateway.issue_body_writes == 0, "parent not written");
                   }});

  tests.push_back({"finalize_close_denied_fails", [] {
                     IssueFixture fx;
                     fx.gateway.denied_closes.insert(42);
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(!result.ok() && result.failure->error == "Issue close failed",
                             "close failure");
                     require(fx.workspace.read_file("session/tasks.md").find("- [ ] T001") == 0,
                             "ledger untouched after fatal error");
                   }});

  tests.push_back({"finalize_malformed_ledger_fails", [] {
                     IssueFixture fx;
                     fx.workspace.create_file("session/tasks.md", "- [ ] T001 ok\n- [~] T002\n");
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(!result.ok() && result.failure->error == "Malformed task ledger",
                             "malformed ledger");
                     require(result.failure->message.find("line 2") != std::string::npos,
                             "line number in message");
                   }});

  tests.push_back({"finalize_sync_failure_keeps_success", [] {
                     PhaseFixture fx;
                     fx.context.sync_enabled = true;
                     fx.gateway.sync_failure = "board sync exited with 2";
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok(), "sync failure must not fail finalize");
                     require(!result.synced_to_projects, "not synced");
                     require(result.ready_for_wrap, "still ready for wrap");
                     require(has_warning(result, "board sync failed"), "sync warning");
                   }});

  tests.push_back({"finalize_sync_uses_feature_milestone", [] {
                     PhaseFixture fx;
                     fx.context.sync_enabled = true;
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok() && result.synced_to_projects, "synced");
                     require(fx.gateway.syncs.size() == 1, "one sync call");
                     require(fx.gateway.syncs[0].second == "007-billing", "milestone");
                     require(fx.gateway.syncs[0].first.find("specs/007-billing/tasks.md") !=
                                 std::string::npos,
                             "ledger path");
                   }});

  tests.push_back({"finalize_is_idempotent", [] {
                     PhaseFixture fx;
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto first = engine.run(fx.context);
                     require(first.ok(), "first run");
                     const std::size_t mutations = fx.gateway.mutating_calls();
                     const std::string parent_body = fx.gateway.issues[50].body;
                     const std::string pr_body = fx.gateway.prs[60].body;

                     const auto second = engine.run(fx.context);
                     require(second.ok(), "second run");
                     require(fx.gateway.mutating_calls() == mutations, "no new mutations");
                     require(fx.gateway.issues[50].body == parent_body, "parent stable");
                     require(fx.gateway.prs[60].body == pr_body, "PR body stable");
                     const auto &outcome = std::get<finalize::SpeckitOutcome>(second.outcome);
                     require(!outcome.phase_issue.comment.has_value(), "no second comment");
                     require(!outcome.parent_issue.updated, "parent not rewritten");
                     require(outcome.parent_issue.checklist_updated, "still checked");
                     require(!outcome.pr.description_updated, "note not duplicated");
                     require(second.tasks.marked == 0, "nothing re-marked");
                   }});

  tests.push_back({"finalize_last_phase_promotes_draft", [] {
                     PhaseFixture fx;
                     fx.gateway.issues[50].body =
                         "- [x] Phase 1 #47\n- [x] Phase 2 #48\n- [ ] Phase 3 #51\n";
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok(), "finalize should succeed");
                     const auto &outcome = std::get<finalize::SpeckitOutcome>(result.outcome);
                     require(outcome.parent_issue.progress == "3/3 phases complete",
                             outcome.parent_issue.progress);
                     require(!outcome.pr.still_draft, "promoted");
                     require(outcome.pr.reason == "all phases complete", outcome.pr.reason);
                     require(fx.gateway.ready_calls == 1, "mark ready called");
                     require(!fx.gateway.prs[60].draft, "no longer draft");
                   }});

  tests.push_back({"finalize_promotion_failure_is_warning", [] {
                     PhaseFixture fx;
                     fx.gateway.issues[50].body = "- [ ] Only phase #51\n";
                     fx.gateway.fail_mark_ready = true;
                     finalize::FinalizeEngine engine(fx.gateway);
                     const auto result = engine.run(fx.context);
                     require(result.ok(), "promotion failure must not fail finalize");
                     const auto &outcome = std::get<finalize::SpeckitOutcome>(result.outcome);
                     require(outcome.pr.still_draft, "still draft");
                     require(has_warning(result, "not promoted out of draft"), "warning");
                   }});

  tests.push_back({"append_phase_note_once", [] {
                     const std::string once =
                         finalize::append_phase_note("Body text", 51, 60, "4/6 phases complete");
                     require(once == "Body text\n\n<!-- sessionflow:phase-51 -->\n"
                                     "Phase #51 complete via PR #60 (4/6 phases complete).\n",
                             once);
                     require(finalize::append_phase_note(once, 51, 60, "5/6 phases complete") ==
                                 once,
                             "marker prevents a second note");
                   }});

  tests.push_back({"finalize_success_json_shape", [] {
                     PhaseFixture fx;
                     finalize::FinalizeEngine engine(fx.gateway);
                     const std::string json = engine.run(fx.context).to_json();
                     for (const char *needle :
                          {"\"status\": \"success\"", "\"pr_merged\": true",
                           "\"session_type\": \"speckit\"", "\"phase_issue\": {",
                           "\"progress\": \"4/6 phases complete\"", "\"still_draft\": true",
                           "\"synced_to_projects\": false", "\"ready_for_wrap\": true"}) {
                       require(json.find(needle) != std::string::npos,
                               std::string("missing ") + needle + " in " + json);
                     }
                   }});

  tests.push_back({"ledger_path_and_milestone", [] {
                     finalize::FinalizeContext context;
                     context.session.session_id = "2025-01-31-1";
                     context.session.details = session::GithubIssueDetails{.issue_number = 9,
                                                                           .issue_title = ""};
                     context.session_dir = "/tmp/s";
                     require(finalize::ledger_path(context) == "/tmp/s/tasks.md", "session ledger");
                     context.session.tasks_file = "/work/TODO.md";
                     require(finalize::ledger_path(context) == "/work/TODO.md", "explicit ledger");
                     require(finalize::sync_milestone(context.session) == "issue-9", "issue milestone");
                     context.session.details = session::UnstructuredDetails{};
                     require(finalize::sync_milestone(context.session) == "session-2025-01-31-1",
                             "session milestone");
                   }});
}
