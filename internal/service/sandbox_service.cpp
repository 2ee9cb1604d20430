#include "sandbox_service.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <type_traits>

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "internal/core/sandbox_manager.hpp"
#include "internal/core/workspace_manager.hpp"
#include "internal/idempotency/idempotency_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace bay::service {

using namespace bay::v1;

namespace {

constexpr int32_t kCreated = 201;
constexpr int32_t kOk      = 200;

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& sandbox_id, Fn&& fn) {
  bay::observability::SpanScope span(route);
  if (!sandbox_id.empty()) {
    span.SetAttribute("sandbox.id", sandbox_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    bay::observability::Metrics::Instance().RecordRequest(route, success);
    bay::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const bay::util::Error& ex) {
    // Domain outcomes are the caller's business; keep them out of the error log.
    span.RecordException(ex.what());
    BAY_LOG_INFO("RPC rejected", {bay::observability::StringField("route", route), bay::observability::StringField("code", ex.Code()),
                                  bay::observability::StringField("error", ex.what()), bay::observability::StringField("sandbox_id", sandbox_id)});
    record(false);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    BAY_LOG_ERROR("RPC failed", {bay::observability::StringField("route", route), bay::observability::StringField("error", ex.what()),
                                 bay::observability::StringField("sandbox_id", sandbox_id)});
    record(false);
    throw;
  }
}

// Stable bytes for fingerprinting: the request minus its idempotency key.
template <typename Request>
std::string FingerprintBody(Request req) {
  req.clear_idempotency_key();
  std::string body;
  {
    google::protobuf::io::StringOutputStream raw(&body);
    google::protobuf::io::CodedOutputStream  out(&raw);
    out.SetSerializationDeterministic(true);
    req.SerializeToCodedStream(&out);
  }
  return body;
}

template <typename Response>
Response FromSnapshot(const idempotency::CachedResponse& cached) {
  Response resp;
  if (!resp.ParseFromString(cached.snapshot)) {
    throw std::runtime_error("idempotency: stored response could not be decoded");
  }
  return resp;
}

} // namespace

SandboxService::SandboxService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.manager || !ctx_.workspaces || !ctx_.ledger) {
    throw std::invalid_argument("SandboxService: manager, workspaces and ledger are required");
  }
}

CreateSandboxResponse SandboxService::Create(const std::string& owner, const CreateSandboxRequest& req) {
  return ObserveRpc("SandboxService.Create", "", [&] {
    const idempotency::LedgerRequest ledger_req{owner, req.idempotency_key(), "POST", "/v1/sandboxes", FingerprintBody(req)};
    const auto cached = ctx_.ledger->Execute(ledger_req, [&] {
      CreateSandboxResponse resp;
      *resp.mutable_sandbox() = ctx_.manager->Create(owner, req.profile(), req.workspace_id(), req.ttl_seconds());
      return idempotency::CachedResponse{resp.SerializeAsString(), kCreated};
    });
    return FromSnapshot<CreateSandboxResponse>(cached);
  });
}

GetSandboxResponse SandboxService::Get(const std::string& owner, const GetSandboxRequest& req) {
  return ObserveRpc("SandboxService.Get", req.sandbox_id(), [&] {
    GetSandboxResponse resp;
    *resp.mutable_sandbox() = ctx_.manager->Get(owner, req.sandbox_id());
    return resp;
  });
}

ListSandboxesResponse SandboxService::List(const std::string& owner, const ListSandboxesRequest& req) {
  return ObserveRpc("SandboxService.List", "", [&] {
    std::optional<SandboxStatus> status;
    if (req.status() != SANDBOX_STATUS_UNSPECIFIED) {
      status = req.status();
    }

    auto                  listing = ctx_.manager->List(owner, status, req.limit(), req.cursor());
    ListSandboxesResponse resp;
    for (auto& item : listing.items) {
      *resp.add_items() = std::move(item);
    }
    resp.set_next_cursor(listing.next_cursor);
    return resp;
  });
}

void SandboxService::Keepalive(const std::string& owner, const KeepaliveRequest& req) {
  ObserveRpc("SandboxService.Keepalive", req.sandbox_id(), [&] { ctx_.manager->Keepalive(owner, req.sandbox_id()); });
}

void SandboxService::Stop(const std::string& owner, const StopSandboxRequest& req) {
  ObserveRpc("SandboxService.Stop", req.sandbox_id(), [&] { ctx_.manager->Stop(owner, req.sandbox_id()); });
}

void SandboxService::Delete(const std::string& owner, const DeleteSandboxRequest& req) {
  ObserveRpc("SandboxService.Delete", req.sandbox_id(), [&] { ctx_.manager->Delete(owner, req.sandbox_id()); });
}

ExtendTtlResponse SandboxService::ExtendTtl(const std::string& owner, const ExtendTtlRequest& req) {
  return ObserveRpc("SandboxService.ExtendTtl", req.sandbox_id(), [&] {
    const idempotency::LedgerRequest ledger_req{owner, req.idempotency_key(), "POST", "/v1/sandboxes/" + req.sandbox_id() + "/extend_ttl",
                                                FingerprintBody(req)};
    const auto cached = ctx_.ledger->Execute(ledger_req, [&] {
      ExtendTtlResponse resp;
      *resp.mutable_sandbox() = ctx_.manager->ExtendTtl(owner, req.sandbox_id(), req.extend_by_seconds());
      return idempotency::CachedResponse{resp.SerializeAsString(), kOk};
    });
    return FromSnapshot<ExtendTtlResponse>(cached);
  });
}

ResolveCapabilityResponse SandboxService::ResolveCapability(const std::string& owner, const ResolveCapabilityRequest& req) {
  return ObserveRpc("SandboxService.ResolveCapability", req.sandbox_id(), [&] {
    if (req.capability().empty()) {
      throw bay::util::ValidationError("resolve capability: capability is required");
    }

    auto handle = ctx_.manager->EnsureRunning(owner, req.sandbox_id());
    if (!handle.adapter->SupportsCapability(req.capability())) {
      const auto meta = handle.adapter->Meta();
      throw bay::util::CapabilityNotSupported("resolve capability: runtime of sandbox " + req.sandbox_id() + " does not provide '" +
                                                  req.capability() + "'",
                                              req.sandbox_id(), req.capability(), meta.capabilities);
    }

    ResolveCapabilityResponse resp;
    resp.set_session_id(handle.session_id);
    resp.set_endpoint(handle.endpoint);
    resp.set_runtime_type(handle.runtime_type);
    return resp;
  });
}

CreateWorkspaceResponse SandboxService::CreateWorkspace(const std::string& owner, const CreateWorkspaceRequest& req) {
  return ObserveRpc("SandboxService.CreateWorkspace", "", [&] {
    CreateWorkspaceResponse resp;
    *resp.mutable_workspace() = ctx_.workspaces->CreateExternal(owner, req.size_limit_mb());
    return resp;
  });
}

void SandboxService::DeleteWorkspace(const std::string& owner, const DeleteWorkspaceRequest& req) {
  ObserveRpc("SandboxService.DeleteWorkspace", "", [&] { ctx_.workspaces->DeleteExternal(owner, req.workspace_id()); });
}

} // namespace bay::service
