#include "release_coordinator.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "internal/coordination/batch_planner.hpp"
#include "internal/graph/cycle_detector.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace release::coordination {

using namespace release::coordinator::v1;
using observability::BoolField;
using observability::DurationField;
using observability::IntField;
using observability::StringField;

namespace {

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += separator;
    out += parts[i];
  }
  return out;
}

template <typename Range>
std::string JoinNames(const Range& names) {
  return Join(std::vector<std::string>(names.begin(), names.end()), ", ");
}

void ValidateRequest(const CoordinateReleaseRequest& request) {
  if (request.release_name().empty()) {
    throw util::ValidationError("release_name is required");
  }
  if (!model::IsDeployableEnvironment(request.environment())) {
    throw util::ValidationError("Invalid environment " + std::to_string(static_cast<int>(request.environment())) + ": expected staging or production");
  }
  if (request.services_size() == 0) {
    throw util::ValidationError("At least one service is required");
  }
}

// Validation gate shared by every strategy. Throws; never deploys.
graph::DependencyGraph BuildValidatedGraph(const graph::ServiceList& services) {
  auto validation = graph::ValidateDependencies(services);
  for (const auto& warning : validation.warnings) {
    RELEASE_LOG_WARN("Dependency warning", {StringField("warning", warning)});
  }
  if (!validation.valid) {
    throw util::ValidationError("Dependency validation failed: " + Join(validation.errors, "; "));
  }

  auto graph  = graph::BuildGraph(services);
  auto cycles = graph::DetectCycles(graph);
  if (!cycles.empty()) {
    std::vector<std::string> described;
    described.reserve(cycles.size());
    for (const auto& cycle : cycles) {
      described.push_back(graph::DescribeCycle(cycle));
    }
    throw util::ValidationError("Circular dependencies detected: " + Join(described, "; "));
  }
  return graph;
}

std::optional<std::chrono::milliseconds> ResolveTimeout(const CoordinateReleaseRequest& request, const CoordinatorOptions& options) {
  if (request.deploy_timeout_ms() > 0) {
    return std::chrono::milliseconds(request.deploy_timeout_ms());
  }
  if (options.default_deploy_timeout.count() > 0) {
    return options.default_deploy_timeout;
  }
  return std::nullopt;
}

ServiceResult FailedResult(const ServiceDeclaration& service, std::string message) {
  ServiceResult result;
  result.set_service(service.name());
  result.set_version(service.version());
  result.set_status(SERVICE_STATUS_FAILED);
  result.set_health_status(HEALTH_STATUS_UNHEALTHY);
  result.set_message(std::move(message));
  return result;
}

ServiceResult SkippedResult(const ServiceDeclaration& service) {
  ServiceResult result;
  result.set_service(service.name());
  result.set_version(service.version());
  result.set_status(SERVICE_STATUS_SKIPPED);
  result.set_message("not attempted: an earlier batch failed");
  return result;
}

/*
  Registry writes during a coordination are best effort. The first failure
  is kept for the response; after a failed AddRelease there is no record to
  update, so later writes are skipped.
*/
class RegistryRecorder {
 public:
  RegistryRecorder(registry::ReleaseRegistry& registry, std::string release_id) : registry_(registry), release_id_(std::move(release_id)) {
  }

  void Add(const ReleaseRecord& record) {
    try {
      registry_.AddRelease(record);
      stored_ = true;
    } catch (const std::exception& e) {
      Fail("add", e);
    }
  }

  void Update(const registry::ReleaseUpdate& update) {
    if (!stored_) {
      return;
    }
    try {
      registry_.UpdateRelease(release_id_, update);
    } catch (const std::exception& e) {
      Fail("update", e);
    }
  }

  const std::string& error() const {
    return error_;
  }

 private:
  void Fail(const char* operation, const std::exception& e) {
    RELEASE_LOG_ERROR("Registry write failed",
                      {StringField("release_id", release_id_), StringField("operation", operation), StringField("error", e.what())});
    if (error_.empty()) {
      error_ = e.what();
    }
  }

  registry::ReleaseRegistry& registry_;
  std::string                release_id_;
  std::string                error_;
  bool                       stored_ = false;
};

} // namespace

HealthStatus AggregateHealth(const std::vector<ServiceResult>& results) {
  bool attempted = false;
  bool degraded  = false;
  for (const auto& result : results) {
    if (result.status() == SERVICE_STATUS_SKIPPED) {
      continue;
    }
    attempted = true;
    if (result.status() == SERVICE_STATUS_FAILED) {
      return HEALTH_STATUS_UNHEALTHY;
    }
    if (result.status() == SERVICE_STATUS_ROLLED_BACK || result.health_status() != HEALTH_STATUS_HEALTHY) {
      degraded = true;
    }
  }
  if (!attempted) {
    return HEALTH_STATUS_UNHEALTHY;
  }
  return degraded ? HEALTH_STATUS_DEGRADED : HEALTH_STATUS_HEALTHY;
}

ReleaseCoordinator::ReleaseCoordinator(std::shared_ptr<registry::ReleaseRegistry> registry, std::shared_ptr<executor::DeploymentExecutor> executor,
                                       std::shared_ptr<notes::ReleaseNotesGenerator> notes, CoordinatorOptions options)
    : registry_(std::move(registry)), executor_(std::move(executor)), notes_(std::move(notes)), options_(options) {
  if (!registry_ || !executor_ || !notes_) {
    throw std::invalid_argument("ReleaseCoordinator requires registry, executor and notes generator");
  }
}

CoordinateReleaseResponse ReleaseCoordinator::CoordinateRelease(const CoordinateReleaseRequest& request) {
  observability::SpanScope span("release.coordinate");
  span.SetAttribute("release.name", request.release_name());
  span.SetAttribute("release.environment", model::EnvironmentName(request.environment()));
  span.SetAttribute("release.services", static_cast<std::int64_t>(request.services_size()));

  ValidateRequest(request);

  const graph::ServiceList services(request.services().begin(), request.services().end());
  const auto               dag      = BuildValidatedGraph(services);
  const auto               strategy = FromProto(request.strategy());
  const auto               batches  = PlanBatches(strategy, dag);
  const auto               timeout  = ResolveTimeout(request, options_);
  const auto               env      = request.environment();

  const auto started_at = std::chrono::steady_clock::now();
  const auto timestamp  = util::Now();
  const auto release_id = registry::ReleaseRegistry::GenerateReleaseId(request.release_name());
  span.SetAttribute("release.id", release_id);

  RELEASE_LOG_INFO("Release started", {StringField("release_id", release_id), StringField("release_name", request.release_name()),
                                       StringField("environment", model::EnvironmentName(env)), StringField("strategy", StrategyName(strategy)),
                                       IntField("services", request.services_size()), IntField("batches", static_cast<std::int64_t>(batches.size())),
                                       BoolField("rollback_on_failure", request.rollback_on_failure())});

  ReleaseRecord record;
  record.set_release_id(release_id);
  record.set_release_name(request.release_name());
  record.set_environment(env);
  *record.mutable_timestamp() = util::ToProto(timestamp);
  record.set_status(RELEASE_STATUS_PENDING);
  for (const auto& service : services) {
    record.add_services(service.name());
  }
  record.set_strategy(request.strategy());
  record.set_rollback_on_failure(request.rollback_on_failure());

  RegistryRecorder recorder(*registry_, release_id);
  recorder.Add(record);

  registry::ReleaseUpdate started;
  started.status = RELEASE_STATUS_IN_PROGRESS;
  recorder.Update(started);

  // Attempted services, in the order their batches ran.
  std::vector<std::string>                       deployment_order;
  std::unordered_map<std::string, ServiceResult> results;
  std::unordered_set<std::string>                reported_success;
  bool                                           failed = false;

  auto snapshot = [&]() {
    std::vector<ServiceResult> out;
    out.reserve(deployment_order.size());
    for (const auto& name : deployment_order) {
      out.push_back(results.at(name));
    }
    return out;
  };

  for (const auto& batch : batches) {
    observability::SpanScope batch_span("release.batch");
    batch_span.SetAttribute("batch.id", static_cast<std::int64_t>(batch.id));
    batch_span.SetAttribute("batch.size", static_cast<std::int64_t>(batch.services.size()));

    auto batch_results = RunBatch(batch, env, timeout);

    std::vector<std::string> batch_failures;
    for (std::size_t i = 0; i < batch.services.size(); ++i) {
      const auto& name = batch.services[i].name();
      if (batch_results[i].result.status() != SERVICE_STATUS_SUCCESS) {
        batch_failures.push_back(name);
      }
      if (batch_results[i].reported_success) {
        reported_success.insert(name);
      }
      deployment_order.push_back(name);
      results[name] = std::move(batch_results[i].result);
    }

    registry::ReleaseUpdate progress;
    progress.status           = RELEASE_STATUS_IN_PROGRESS;
    progress.deployment_order = deployment_order;
    progress.service_results  = snapshot();
    recorder.Update(progress);

    if (!batch_failures.empty()) {
      failed = true;
      batch_span.RecordException("failed services: " + JoinNames(batch_failures));
      RELEASE_LOG_WARN("Batch failed", {StringField("release_id", release_id), IntField("batch", batch.id),
                                        StringField("failed_services", JoinNames(batch_failures))});
      break;
    }
    RELEASE_LOG_INFO("Batch completed", {StringField("release_id", release_id), IntField("batch", batch.id)});
  }

  ReleaseStatus status = RELEASE_STATUS_SUCCESS;
  if (failed) {
    status = RELEASE_STATUS_FAILED;

    if (request.rollback_on_failure()) {
      std::vector<std::string> to_rollback;
      for (auto it = deployment_order.rbegin(); it != deployment_order.rend(); ++it) {
        // A success that overran its timeout is still live on the target.
        if (reported_success.count(*it) > 0) {
          to_rollback.push_back(*it);
        }
      }

      if (!to_rollback.empty()) {
        observability::SpanScope rollback_span("release.rollback");
        rollback_span.SetAttribute("rollback.services", static_cast<std::int64_t>(to_rollback.size()));
        RELEASE_LOG_WARN("Rolling back release", {StringField("release_id", release_id), StringField("services", JoinNames(to_rollback))});

        const std::string reason = "Release " + request.release_name() + " failed during deployment";
        for (const auto& name : to_rollback) {
          results[name] = RollbackService(dag.nodes.at(name), results.at(name), env, reason);
        }
        status = RELEASE_STATUS_ROLLED_BACK;
      }
    }
  }

  // One result per declared service, in planned order.
  std::vector<ServiceResult> service_results;
  service_results.reserve(services.size());
  for (const auto& batch : batches) {
    for (const auto& service : batch.services) {
      auto it = results.find(service.name());
      service_results.push_back(it != results.end() ? it->second : SkippedResult(service));
    }
  }

  const auto duration_ms = util::ElapsedMillis(started_at);
  const auto health      = AggregateHealth(service_results);

  record.set_status(status);
  for (const auto& name : deployment_order) {
    record.add_deployment_order(name);
  }
  for (const auto& result : service_results) {
    *record.add_service_results() = result;
  }
  record.set_duration_ms(duration_ms);
  record.set_overall_health(health);

  std::string notes_path;
  try {
    notes_path = notes_->Generate(record);
  } catch (const std::exception& e) {
    RELEASE_LOG_ERROR("Release notes generation failed", {StringField("release_id", release_id), StringField("error", e.what())});
  }
  record.set_release_notes_path(notes_path);

  registry::ReleaseUpdate final_update;
  final_update.status             = status;
  final_update.deployment_order   = deployment_order;
  final_update.service_results    = service_results;
  final_update.duration_ms        = duration_ms;
  final_update.overall_health     = health;
  final_update.release_notes_path = notes_path;
  recorder.Update(final_update);

  if (request.notify_channels_size() > 0) {
    RELEASE_LOG_INFO("Release notification", {StringField("release_id", release_id), StringField("channels", JoinNames(request.notify_channels())),
                                               StringField("status", model::ReleaseStatusName(status))});
  }

  CoordinateReleaseResponse response;
  response.set_success(status == RELEASE_STATUS_SUCCESS);
  response.set_release_id(release_id);
  response.set_environment(env);
  *response.mutable_timestamp() = record.timestamp();
  *response.mutable_deployment_order() = record.deployment_order();
  *response.mutable_service_results()  = record.service_results();
  response.set_overall_health(health);
  response.set_release_notes(notes_path);
  response.set_registry_error(recorder.error());

  auto* summary = response.mutable_summary();
  summary->set_total_services(static_cast<uint32_t>(services.size()));
  summary->set_duration_ms(duration_ms);
  for (const auto& result : service_results) {
    switch (result.status()) {
      case SERVICE_STATUS_SUCCESS:
        summary->set_deployed(summary->deployed() + 1);
        break;
      case SERVICE_STATUS_FAILED:
        summary->set_failed(summary->failed() + 1);
        break;
      case SERVICE_STATUS_ROLLED_BACK:
        summary->set_rolled_back(summary->rolled_back() + 1);
        break;
      case SERVICE_STATUS_SKIPPED:
        summary->set_skipped(summary->skipped() + 1);
        break;
      default:
        break;
    }
  }

  span.SetAttribute("release.status", model::ReleaseStatusName(status));
  RELEASE_LOG_INFO("Release finished",
                   {StringField("release_id", release_id), StringField("status", model::ReleaseStatusName(status)),
                    StringField("health", model::HealthStatusName(health)), IntField("deployed", summary->deployed()),
                    IntField("failed", summary->failed()), IntField("rolled_back", summary->rolled_back()), IntField("skipped", summary->skipped()),
                    DurationField("duration", std::chrono::milliseconds(duration_ms))});
  return response;
}

std::vector<ReleaseCoordinator::Deployment> ReleaseCoordinator::RunBatch(const graph::Batch& batch, Environment environment,
                                                                         std::optional<std::chrono::milliseconds> timeout) const {
  const std::size_t       count = batch.services.size();
  std::vector<Deployment> results(count);
  if (count == 0) {
    return results;
  }

  std::size_t workers = options_.max_parallel_deployments == 0 ? count : std::min<std::size_t>(count, options_.max_parallel_deployments);

  std::atomic<std::size_t> next{0};
  auto                     work = [&]() {
    for (std::size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
      // Nothing may escape a worker thread; an escaped exception terminates the process.
      try {
        results[i] = DeployService(batch.services[i], environment, timeout);
      } catch (const std::exception& e) {
        results[i].result = FailedResult(batch.services[i], std::string("deployment error: ") + e.what());
      } catch (...) {
        results[i].result = FailedResult(batch.services[i], "deployment error: unknown exception");
      }
    }
  };

  // The calling thread is one of the workers.
  std::vector<std::thread> threads;
  threads.reserve(workers - 1);
  for (std::size_t i = 1; i < workers; ++i) {
    try {
      threads.emplace_back(work);
    } catch (const std::system_error& e) {
      RELEASE_LOG_WARN("Could not start deployment worker", {IntField("batch", batch.id), StringField("error", e.what())});
      break;
    }
  }
  work();
  for (auto& thread : threads) {
    thread.join();
  }
  return results;
}

ReleaseCoordinator::Deployment ReleaseCoordinator::DeployService(const ServiceDeclaration& service, Environment environment,
                                                                std::optional<std::chrono::milliseconds> timeout) const {
  const auto started_at = std::chrono::steady_clock::now();

  ServiceResult result;
  try {
    result = executor_->Deploy(service, environment, timeout);
  } catch (const util::DeploymentError& e) {
    result = FailedResult(service, e.what());
  } catch (const std::exception& e) {
    result = FailedResult(service, std::string("deployment error: ") + e.what());
  } catch (...) {
    result = FailedResult(service, "deployment error: unknown exception");
  }

  Deployment deployment;
  deployment.reported_success = result.status() == SERVICE_STATUS_SUCCESS;

  const auto elapsed = util::ElapsedMillis(started_at);
  result.set_service(service.name());
  if (result.version().empty()) {
    result.set_version(service.version());
  }
  result.set_duration_ms(elapsed);

  if (result.status() == SERVICE_STATUS_UNSPECIFIED) {
    result.set_status(SERVICE_STATUS_FAILED);
    result.set_message("executor reported no status");
  }
  if (result.status() == SERVICE_STATUS_SUCCESS && timeout && elapsed > static_cast<uint64_t>(timeout->count())) {
    result.set_status(SERVICE_STATUS_FAILED);
    result.set_message("deployment exceeded timeout of " + std::to_string(timeout->count()) + " ms");
    result.set_health_status(HEALTH_STATUS_UNHEALTHY);
  }
  if (result.health_status() == HEALTH_STATUS_UNSPECIFIED) {
    result.set_health_status(result.status() == SERVICE_STATUS_SUCCESS ? HEALTH_STATUS_HEALTHY : HEALTH_STATUS_UNHEALTHY);
  }

  if (result.status() == SERVICE_STATUS_SUCCESS) {
    RELEASE_LOG_INFO("Service deployed", {StringField("service", service.name()), StringField("version", result.version()),
                                          DurationField("duration", std::chrono::milliseconds(elapsed))});
  } else {
    RELEASE_LOG_WARN("Service deployment failed", {StringField("service", service.name()), StringField("error", result.message())});
  }
  deployment.result = std::move(result);
  return deployment;
}

ServiceResult ReleaseCoordinator::RollbackService(const ServiceDeclaration& service, const ServiceResult& deployed, Environment environment,
                                                  const std::string& reason) const {
  const auto started_at = std::chrono::steady_clock::now();

  ServiceResult rollback;
  std::string   error;
  try {
    rollback = executor_->Rollback(service, environment, reason);
    if (rollback.status() != SERVICE_STATUS_ROLLED_BACK && rollback.status() != SERVICE_STATUS_SUCCESS) {
      error = rollback.message().empty() ? "executor did not confirm rollback" : rollback.message();
    }
  } catch (const std::exception& e) {
    error = e.what();
  } catch (...) {
    error = "unknown exception";
  }

  ServiceResult result = deployed;
  result.set_duration_ms(deployed.duration_ms() + util::ElapsedMillis(started_at));
  if (!error.empty()) {
    RELEASE_LOG_ERROR("Service rollback failed", {StringField("service", service.name()), StringField("error", error)});
    result.set_status(SERVICE_STATUS_FAILED);
    result.set_health_status(HEALTH_STATUS_UNHEALTHY);
    result.set_message("rollback failed: " + error);
    return result;
  }

  RELEASE_LOG_INFO("Service rolled back", {StringField("service", service.name())});
  result.set_status(SERVICE_STATUS_ROLLED_BACK);
  if (!rollback.deployment_id().empty()) {
    result.set_deployment_id(rollback.deployment_id());
  }
  result.set_health_status(rollback.health_status() == HEALTH_STATUS_UNSPECIFIED ? HEALTH_STATUS_HEALTHY : rollback.health_status());
  result.set_message(rollback.message().empty() ? "rolled back after release failure" : rollback.message());
  return result;
}

} // namespace release::coordination
