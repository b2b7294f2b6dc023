#include "internal/coordination/release_coordinator.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace release::coordinator::v1;
using release::coordination::AggregateHealth;
using release::coordination::CoordinatorOptions;
using release::coordination::ReleaseCoordinator;

struct Behavior {
  bool fail          = false;
  bool throw_error   = false;
  bool throw_foreign = false;
  bool rollback_fail = false;
  int  sleep_ms      = 0;
};

class FakeExecutor final : public release::executor::DeploymentExecutor {
 public:
  explicit FakeExecutor(std::map<std::string, Behavior> behaviors = {}) : behaviors_(std::move(behaviors)) {
  }

  ServiceResult Deploy(const ServiceDeclaration& service, Environment, std::optional<std::chrono::milliseconds>) override {
    deploy_calls.fetch_add(1);
    const int now_in_flight = in_flight.fetch_add(1) + 1;
    int       seen          = max_in_flight.load();
    while (now_in_flight > seen && !max_in_flight.compare_exchange_weak(seen, now_in_flight)) {
    }

    if (on_deploy) {
      on_deploy();
    }

    const auto behavior = BehaviorFor(service.name());
    if (behavior.sleep_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(behavior.sleep_ms));
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      deployed.push_back(service.name());
    }
    in_flight.fetch_sub(1);

    if (behavior.throw_error) {
      throw release::util::DeploymentError("agent unreachable for " + service.name());
    }
    if (behavior.throw_foreign) {
      throw 42;
    }

    ServiceResult result;
    result.set_service(service.name());
    result.set_deployment_id("deploy-" + service.name());
    result.set_status(behavior.fail ? SERVICE_STATUS_FAILED : SERVICE_STATUS_SUCCESS);
    result.set_health_status(behavior.fail ? HEALTH_STATUS_UNHEALTHY : HEALTH_STATUS_HEALTHY);
    if (behavior.fail) {
      result.set_message("health check failed");
    }
    return result;
  }

  ServiceResult Rollback(const ServiceDeclaration& service, Environment, const std::string& reason) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      rolled_back.push_back(service.name());
      last_reason = reason;
    }
    if (BehaviorFor(service.name()).rollback_fail) {
      throw release::util::DeploymentError("previous version unavailable");
    }

    ServiceResult result;
    result.set_service(service.name());
    result.set_deployment_id("rollback-" + service.name());
    result.set_status(SERVICE_STATUS_ROLLED_BACK);
    result.set_health_status(HEALTH_STATUS_HEALTHY);
    return result;
  }

  std::atomic<int>         deploy_calls{0};
  std::atomic<int>         in_flight{0};
  std::atomic<int>         max_in_flight{0};
  std::vector<std::string> deployed;
  std::vector<std::string> rolled_back;
  std::string              last_reason;
  std::function<void()>    on_deploy;

 private:
  Behavior BehaviorFor(const std::string& name) const {
    auto it = behaviors_.find(name);
    return it == behaviors_.end() ? Behavior{} : it->second;
  }

  std::map<std::string, Behavior> behaviors_;
  std::mutex                      mutex_;
};

class ThrowingNotes final : public release::notes::ReleaseNotesGenerator {
 public:
  std::string Generate(const ReleaseRecord&) override {
    throw std::runtime_error("notes disk full");
  }
};

std::filesystem::path FreshProject(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "release_coordinator_coordination_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

struct Harness {
  std::filesystem::path                                project;
  std::shared_ptr<release::registry::ReleaseRegistry>  registry;
  std::shared_ptr<FakeExecutor>                        executor;
  std::unique_ptr<ReleaseCoordinator>                  coordinator;
};

Harness MakeHarness(const std::string& test_name, std::map<std::string, Behavior> behaviors = {}, CoordinatorOptions options = {},
                    std::shared_ptr<release::notes::ReleaseNotesGenerator> notes = nullptr) {
  Harness h;
  h.project  = FreshProject(test_name);
  h.registry = std::make_shared<release::registry::ReleaseRegistry>(h.project);
  h.registry->Initialize();
  h.executor = std::make_shared<FakeExecutor>(std::move(behaviors));
  if (!notes) {
    notes = std::make_shared<release::notes::PathReleaseNotesGenerator>(h.project);
  }
  h.coordinator = std::make_unique<ReleaseCoordinator>(h.registry, h.executor, notes, options);
  return h;
}

void AddService(CoordinateReleaseRequest* req, const std::string& name, std::initializer_list<std::string> deps = {}) {
  auto* service = req->add_services();
  service->set_name(name);
  service->set_version("1.4.0");
  for (const auto& dep : deps) {
    service->add_dependencies(dep);
  }
}

CoordinateReleaseRequest MakeRequest(Strategy strategy = STRATEGY_DEPENDENCY_ORDER, bool rollback = false) {
  CoordinateReleaseRequest req;
  req.set_release_name("Spring Release");
  req.set_environment(ENVIRONMENT_STAGING);
  req.set_strategy(strategy);
  req.set_rollback_on_failure(rollback);
  return req;
}

// Fourth link of a chain fails: d -> c -> b -> a deploys a, b, c, d.
CoordinateReleaseRequest MakeChain(Strategy strategy, bool rollback) {
  auto req = MakeRequest(strategy, rollback);
  AddService(&req, "a");
  AddService(&req, "b", {"a"});
  AddService(&req, "c", {"b"});
  AddService(&req, "d", {"c"});
  return req;
}

const ServiceResult& ResultFor(const CoordinateReleaseResponse& resp, const std::string& name) {
  for (const auto& result : resp.service_results()) {
    if (result.service() == name) {
      return result;
    }
  }
  assert(false && "missing service result");
  return resp.service_results(0);
}

template <typename Fn>
std::string ValidationMessage(Fn&& fn) {
  try {
    fn();
  } catch (const release::util::ValidationError& e) {
    return e.what();
  }
  return {};
}

void TestCycleAbortsBeforeAnyDeployment() {
  auto h   = MakeHarness("cycle");
  auto req = MakeRequest();
  AddService(&req, "A", {"B"});
  AddService(&req, "B", {"C"});
  AddService(&req, "C", {"A"});

  const auto message = ValidationMessage([&] { h.coordinator->CoordinateRelease(req); });
  assert(message.find("A -> B -> C -> A") != std::string::npos);
  assert(h.executor->deploy_calls.load() == 0);
  assert(h.registry->ListReleases().empty());
}

void TestCycleIsRejectedForParallelToo() {
  auto h   = MakeHarness("cycle_parallel");
  auto req = MakeRequest(STRATEGY_PARALLEL);
  AddService(&req, "x", {"y"});
  AddService(&req, "y", {"x"});

  assert(!ValidationMessage([&] { h.coordinator->CoordinateRelease(req); }).empty());
  assert(h.executor->deploy_calls.load() == 0);
}

void TestMissingDependencyAbortsWithNoSideEffects() {
  auto h   = MakeHarness("ghost");
  auto req = MakeRequest();
  AddService(&req, "api", {"ghost"});

  const auto message = ValidationMessage([&] { h.coordinator->CoordinateRelease(req); });
  assert(message.find("'ghost'") != std::string::npos);
  assert(h.executor->deploy_calls.load() == 0);
  assert(h.registry->ListReleases().empty());
}

void TestInvalidEnvironmentIsRejectedUpFront() {
  auto h = MakeHarness("environment");
  for (auto environment : {ENVIRONMENT_UNSPECIFIED, static_cast<Environment>(42)}) {
    auto req = MakeRequest();
    req.set_environment(environment);
    AddService(&req, "api");

    assert(!ValidationMessage([&] { h.coordinator->CoordinateRelease(req); }).empty());
  }

  auto empty = MakeRequest();
  assert(!ValidationMessage([&] { h.coordinator->CoordinateRelease(empty); }).empty());

  assert(h.executor->deploy_calls.load() == 0);
  assert(h.registry->ListReleases().empty());
}

void TestDiamondDeploysInDependencyOrder() {
  auto h   = MakeHarness("diamond");
  auto req = MakeRequest();
  AddService(&req, "A", {"B", "C"});
  AddService(&req, "B", {"D"});
  AddService(&req, "C", {"D"});
  AddService(&req, "D");
  req.add_notify_channels("#releases");

  const auto resp = h.coordinator->CoordinateRelease(req);
  assert(resp.success());
  assert(resp.registry_error().empty());
  assert(resp.overall_health() == HEALTH_STATUS_HEALTHY);
  assert(resp.release_id().rfind("release-spring-release-", 0) == 0);

  const std::vector<std::string> order(resp.deployment_order().begin(), resp.deployment_order().end());
  assert((order == std::vector<std::string>{"D", "B", "C", "A"}));
  assert(resp.summary().total_services() == 4);
  assert(resp.summary().deployed() == 4);
  assert(resp.summary().skipped() == 0);

  // Planned order, one result per service.
  assert(resp.service_results_size() == 4);
  assert(resp.service_results(0).service() == "D");
  assert(resp.service_results(0).version() == "1.4.0");

  const auto notes = std::filesystem::path(resp.release_notes());
  assert(notes.parent_path() == h.project / ".deployment-registry" / "release-notes" / "staging");
  assert(notes.filename().string().rfind("spring-release-", 0) == 0);
  assert(notes.extension() == ".md");

  const auto stored = h.registry->GetRelease(resp.release_id());
  assert(stored.has_value());
  assert(stored->status() == RELEASE_STATUS_SUCCESS);
  assert(stored->deployment_order_size() == 4);
  assert(stored->service_results_size() == 4);
  assert(stored->release_notes_path() == resp.release_notes());
  assert(stored->overall_health() == HEALTH_STATUS_HEALTHY);
}

void TestRollbackAcrossThreeBatches() {
  auto h = MakeHarness("rollback", {{"d", Behavior{true}}});

  const auto resp = h.coordinator->CoordinateRelease(MakeChain(STRATEGY_DEPENDENCY_ORDER, true));
  assert(!resp.success());
  assert((h.executor->rolled_back == std::vector<std::string>{"c", "b", "a"}));
  assert(h.executor->last_reason == "Release Spring Release failed during deployment");

  assert(ResultFor(resp, "a").status() == SERVICE_STATUS_ROLLED_BACK);
  assert(ResultFor(resp, "b").status() == SERVICE_STATUS_ROLLED_BACK);
  assert(ResultFor(resp, "c").status() == SERVICE_STATUS_ROLLED_BACK);
  assert(ResultFor(resp, "c").deployment_id() == "rollback-c");
  assert(ResultFor(resp, "d").status() == SERVICE_STATUS_FAILED);
  assert(resp.summary().rolled_back() == 3);
  assert(resp.summary().failed() == 1);
  assert(resp.overall_health() == HEALTH_STATUS_UNHEALTHY);

  assert(h.registry->GetRelease(resp.release_id())->status() == RELEASE_STATUS_ROLLED_BACK);
}

void TestRollbackSkipsBatchesAfterTheFailure() {
  // Batches: [A] [B C] [D]; C fails in the middle batch.
  auto h   = MakeHarness("rollback_mid_batch", {{"C", Behavior{true}}});
  auto req = MakeRequest(STRATEGY_DEPENDENCY_ORDER, true);
  AddService(&req, "A");
  AddService(&req, "B", {"A"});
  AddService(&req, "C", {"A"});
  AddService(&req, "D", {"B"});

  const auto resp = h.coordinator->CoordinateRelease(req);
  assert(!resp.success());
  assert(h.executor->deploy_calls.load() == 3);
  assert(std::find(h.executor->deployed.begin(), h.executor->deployed.end(), "D") == h.executor->deployed.end());
  assert((h.executor->rolled_back == std::vector<std::string>{"B", "A"}));

  assert(ResultFor(resp, "A").status() == SERVICE_STATUS_ROLLED_BACK);
  assert(ResultFor(resp, "B").status() == SERVICE_STATUS_ROLLED_BACK);
  assert(ResultFor(resp, "C").status() == SERVICE_STATUS_FAILED);
  assert(ResultFor(resp, "D").status() == SERVICE_STATUS_SKIPPED);
  assert(resp.deployment_order_size() == 3);
  assert(resp.summary().rolled_back() == 2);
  assert(resp.summary().failed() == 1);
  assert(resp.summary().skipped() == 1);

  const auto stored = h.registry->GetRelease(resp.release_id());
  assert(stored->status() == RELEASE_STATUS_ROLLED_BACK);
  assert(stored->service_results_size() == 4);
}

void TestFailedRollbackIsReported() {
  Behavior broken_rollback;
  broken_rollback.rollback_fail = true;
  auto h = MakeHarness("rollback_failure", {{"d", Behavior{true}}, {"b", broken_rollback}});

  const auto resp = h.coordinator->CoordinateRelease(MakeChain(STRATEGY_SEQUENTIAL, true));
  assert((h.executor->rolled_back == std::vector<std::string>{"c", "b", "a"}));
  assert(ResultFor(resp, "b").status() == SERVICE_STATUS_FAILED);
  assert(ResultFor(resp, "b").message().rfind("rollback failed: ", 0) == 0);
  assert(ResultFor(resp, "a").status() == SERVICE_STATUS_ROLLED_BACK);
  assert(resp.summary().failed() == 2);
}

void TestFailureWithoutRollbackSkipsRemainingBatches() {
  auto h = MakeHarness("skip", {{"b", Behavior{true}}});

  const auto resp = h.coordinator->CoordinateRelease(MakeChain(STRATEGY_SEQUENTIAL, false));
  assert(!resp.success());
  assert(h.executor->deploy_calls.load() == 2);
  assert(h.executor->rolled_back.empty());

  assert(resp.deployment_order_size() == 2);
  assert(resp.service_results_size() == 4);
  assert(resp.service_results(0).status() == SERVICE_STATUS_SUCCESS);
  assert(resp.service_results(1).status() == SERVICE_STATUS_FAILED);
  assert(resp.service_results(2).status() == SERVICE_STATUS_SKIPPED);
  assert(resp.service_results(3).status() == SERVICE_STATUS_SKIPPED);
  assert(resp.summary().skipped() == 2);

  assert(h.registry->GetRelease(resp.release_id())->status() == RELEASE_STATUS_FAILED);
}

void TestNothingToRollBackStaysFailed() {
  auto h   = MakeHarness("nothing_to_rollback", {{"only", Behavior{true}}});
  auto req = MakeRequest(STRATEGY_DEPENDENCY_ORDER, true);
  AddService(&req, "only");

  const auto resp = h.coordinator->CoordinateRelease(req);
  assert(h.executor->rolled_back.empty());
  assert(h.registry->GetRelease(resp.release_id())->status() == RELEASE_STATUS_FAILED);
}

void TestSiblingsAreAwaitedAndRolledBack() {
  Behavior slow;
  slow.sleep_ms = 150;
  Behavior fast_fail;
  fast_fail.fail = true;
  auto h         = MakeHarness("fail_complete", {{"slow", slow}, {"fast", fast_fail}});

  auto req = MakeRequest(STRATEGY_PARALLEL, true);
  AddService(&req, "fast");
  AddService(&req, "slow");

  const auto resp = h.coordinator->CoordinateRelease(req);
  assert(h.executor->deploy_calls.load() == 2);
  assert(h.executor->in_flight.load() == 0);
  assert(resp.deployment_order_size() == 2);
  assert((h.executor->rolled_back == std::vector<std::string>{"slow"}));
  assert(ResultFor(resp, "slow").status() == SERVICE_STATUS_ROLLED_BACK);
  assert(ResultFor(resp, "slow").duration_ms() >= 150);
}

void TestTimeoutAndExecutorErrorsBecomeFailures() {
  Behavior slow;
  slow.sleep_ms = 120;
  Behavior unreachable;
  unreachable.throw_error = true;

  CoordinatorOptions options;
  options.default_deploy_timeout = std::chrono::milliseconds(30);
  auto h                         = MakeHarness("timeout", {{"slow", slow}, {"down", unreachable}}, options);

  auto req = MakeRequest(STRATEGY_PARALLEL);
  AddService(&req, "slow");
  AddService(&req, "down");
  AddService(&req, "quick");

  const auto resp = h.coordinator->CoordinateRelease(req);
  assert(!resp.success());
  assert(ResultFor(resp, "slow").status() == SERVICE_STATUS_FAILED);
  assert(ResultFor(resp, "slow").message() == "deployment exceeded timeout of 30 ms");
  assert(ResultFor(resp, "down").status() == SERVICE_STATUS_FAILED);
  assert(ResultFor(resp, "down").health_status() == HEALTH_STATUS_UNHEALTHY);
  assert(ResultFor(resp, "down").message() == "agent unreachable for down");
  assert(ResultFor(resp, "quick").status() == SERVICE_STATUS_SUCCESS);
  assert(resp.summary().failed() == 2);
}

void TestLateSuccessIsRolledBack() {
  Behavior slow;
  slow.sleep_ms = 120;

  CoordinatorOptions options;
  options.default_deploy_timeout = std::chrono::milliseconds(30);
  auto h                         = MakeHarness("late_success", {{"slow", slow}, {"bad", Behavior{true}}}, options);

  auto req = MakeRequest(STRATEGY_PARALLEL, true);
  AddService(&req, "quick");
  AddService(&req, "slow");
  AddService(&req, "bad");

  const auto resp = h.coordinator->CoordinateRelease(req);
  assert(!resp.success());
  // The slow deploy answered SUCCESS after the deadline and must not stay live.
  assert((h.executor->rolled_back == std::vector<std::string>{"slow", "quick"}));
  assert(ResultFor(resp, "slow").status() == SERVICE_STATUS_ROLLED_BACK);
  assert(ResultFor(resp, "slow").deployment_id() == "rollback-slow");
  assert(ResultFor(resp, "quick").status() == SERVICE_STATUS_ROLLED_BACK);
  assert(ResultFor(resp, "bad").status() == SERVICE_STATUS_FAILED);
  assert(h.registry->GetRelease(resp.release_id())->status() == RELEASE_STATUS_ROLLED_BACK);
}

void TestForeignExceptionBecomesFailure() {
  Behavior foreign;
  foreign.throw_foreign = true;
  auto h                = MakeHarness("foreign_exception", {{"legacy", foreign}});

  auto req = MakeRequest(STRATEGY_PARALLEL);
  AddService(&req, "legacy");
  AddService(&req, "api");

  const auto resp = h.coordinator->CoordinateRelease(req);
  assert(!resp.success());
  assert(ResultFor(resp, "legacy").status() == SERVICE_STATUS_FAILED);
  assert(ResultFor(resp, "legacy").message() == "deployment error: unknown exception");
  assert(ResultFor(resp, "api").status() == SERVICE_STATUS_SUCCESS);
}

void TestRecordMovesFromPendingToInProgress() {
  auto h   = MakeHarness("pending");
  auto req = MakeRequest();
  AddService(&req, "api");

  std::atomic<bool> observed{false};
  h.executor->on_deploy = [&] {
    const auto releases = h.registry->ListReleases();
    assert(releases.size() == 1);
    assert(releases[0].status() == RELEASE_STATUS_IN_PROGRESS);
    observed = true;
  };

  const auto resp = h.coordinator->CoordinateRelease(req);
  assert(resp.success());
  assert(observed.load());
  assert(h.registry->GetRelease(resp.release_id())->status() == RELEASE_STATUS_SUCCESS);
}

void TestFanOutIsBounded() {
  std::map<std::string, Behavior> behaviors;
  auto                            req = MakeRequest(STRATEGY_PARALLEL);
  for (int i = 0; i < 6; ++i) {
    const auto name = "svc-" + std::to_string(i);
    behaviors[name].sleep_ms = 40;
    AddService(&req, name);
  }

  CoordinatorOptions options;
  options.max_parallel_deployments = 2;
  auto h                           = MakeHarness("bounded", behaviors, options);

  const auto resp = h.coordinator->CoordinateRelease(req);
  assert(resp.success());
  assert(h.executor->deploy_calls.load() == 6);
  assert(h.executor->max_in_flight.load() <= 2);
}

void TestRegistryFailureStillReturnsResult() {
  const auto project = FreshProject("registry_failure");
  {
    // A regular file where the registry directory should be.
    std::ofstream blocker(project / ".deployment-registry");
    blocker << "not a directory";
  }

  auto registry    = std::make_shared<release::registry::ReleaseRegistry>(project);
  auto executor    = std::make_shared<FakeExecutor>();
  auto notes       = std::make_shared<release::notes::PathReleaseNotesGenerator>(project);
  auto coordinator = std::make_unique<ReleaseCoordinator>(registry, executor, notes);

  auto req = MakeRequest();
  AddService(&req, "api");

  const auto resp = coordinator->CoordinateRelease(req);
  assert(resp.success());
  assert(!resp.registry_error().empty());
  assert(resp.summary().deployed() == 1);
  assert(executor->deploy_calls.load() == 1);
}

void TestNotesFailureLeavesPathEmpty() {
  auto h   = MakeHarness("notes_failure", {}, {}, std::make_shared<ThrowingNotes>());
  auto req = MakeRequest();
  AddService(&req, "api");

  const auto resp = h.coordinator->CoordinateRelease(req);
  assert(resp.success());
  assert(resp.release_notes().empty());
  assert(h.registry->GetRelease(resp.release_id())->status() == RELEASE_STATUS_SUCCESS);
}

void TestConcurrentReleasesAreIndependent() {
  auto h = MakeHarness("concurrent");

  std::vector<CoordinateReleaseResponse> responses(4);
  std::vector<std::thread>               threads;
  for (std::size_t i = 0; i < responses.size(); ++i) {
    threads.emplace_back([&, i] {
      auto req = MakeRequest(STRATEGY_PARALLEL);
      AddService(&req, "svc-" + std::to_string(i));
      responses[i] = h.coordinator->CoordinateRelease(req);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::string> ids;
  for (const auto& resp : responses) {
    assert(resp.success());
    assert(resp.registry_error().empty());
    ids.insert(resp.release_id());
  }
  assert(ids.size() == responses.size());
  assert(h.registry->ListReleases(ENVIRONMENT_STAGING, RELEASE_STATUS_SUCCESS).size() == responses.size());
}

void TestAggregateHealth() {
  std::vector<ServiceResult> results;
  assert(AggregateHealth(results) == HEALTH_STATUS_UNHEALTHY);

  ServiceResult skipped;
  skipped.set_status(SERVICE_STATUS_SKIPPED);
  results.push_back(skipped);
  assert(AggregateHealth(results) == HEALTH_STATUS_UNHEALTHY);

  ServiceResult ok;
  ok.set_status(SERVICE_STATUS_SUCCESS);
  ok.set_health_status(HEALTH_STATUS_HEALTHY);
  results.push_back(ok);
  assert(AggregateHealth(results) == HEALTH_STATUS_HEALTHY);

  ServiceResult warning = ok;
  warning.set_health_status(HEALTH_STATUS_DEGRADED);
  results.push_back(warning);
  assert(AggregateHealth(results) == HEALTH_STATUS_DEGRADED);

  ServiceResult failed;
  failed.set_status(SERVICE_STATUS_FAILED);
  results.push_back(failed);
  assert(AggregateHealth(results) == HEALTH_STATUS_UNHEALTHY);
}

} // namespace

int main() {
  TestCycleAbortsBeforeAnyDeployment();
  TestCycleIsRejectedForParallelToo();
  TestMissingDependencyAbortsWithNoSideEffects();
  TestInvalidEnvironmentIsRejectedUpFront();
  TestDiamondDeploysInDependencyOrder();
  TestRollbackAcrossThreeBatches();
  TestRollbackSkipsBatchesAfterTheFailure();
  TestFailedRollbackIsReported();
  TestFailureWithoutRollbackSkipsRemainingBatches();
  TestNothingToRollBackStaysFailed();
  TestSiblingsAreAwaitedAndRolledBack();
  TestTimeoutAndExecutorErrorsBecomeFailures();
  TestLateSuccessIsRolledBack();
  TestForeignExceptionBecomesFailure();
  TestRecordMovesFromPendingToInProgress();
  TestFanOutIsBounded();
  TestRegistryFailureStillReturnsResult();
  TestNotesFailureLeavesPathEmpty();
  TestConcurrentReleasesAreIndependent();
  TestAggregateHealth();

  std::cout << "release_coordinator_unit_release_coordinator: pass\n";
  return 0;
}
