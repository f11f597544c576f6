#include "control_service.hpp"

#include "internal/core/deployment.hpp"
#include "internal/exec/wiring_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace meshdeploy::service {

namespace {

std::optional<capability::OutputChannel> ParseChannel(const std::string& channel) {
  if (channel.empty()) return std::nullopt;
  if (channel == "stdout") return capability::OutputChannel::kStdout;
  if (channel == "stderr") return capability::OutputChannel::kStderr;
  throw util::DeclarationError("unknown output channel '" + channel + "' (expected stdout or stderr)");
}

} // namespace

ControlService::ControlService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.deployment) {
    throw util::InvalidState("control service requires a deployment");
  }
}

meshdeploy::v1::GetStatusResponse ControlService::GetStatus(const meshdeploy::v1::GetStatusRequest&) const {
  const auto status = ctx_.deployment->Status();

  meshdeploy::v1::GetStatusResponse resp;
  resp.set_deployment_id(status.id);
  resp.set_state(std::string(model::ToString(status.state)));

  for (const auto& host : status.hosts) {
    auto* out = resp.add_hosts();
    out->set_id(host.id);
    out->set_provider(host.provider);
    out->set_state(std::string(model::ToString(host.state)));
    out->set_locality(host.locality.ToString());
    out->set_address(host.address);
  }
  for (const auto& service : status.services) {
    auto* out = resp.add_services();
    out->set_id(service.id);
    out->set_host(service.host_id);
    out->set_state(std::string(model::ToString(service.state)));
    out->set_has_exit(service.exit_code.has_value());
    out->set_exit_code(service.exit_code.value_or(0));
    out->set_kind(std::string(model::ToString(service.kind)));
  }
  return resp;
}

std::unique_ptr<supervisor::OutputSubscription> ControlService::OpenOutput(const meshdeploy::v1::StreamOutputRequest& req) {
  supervisor::OutputFilter filter;
  filter.channel = ParseChannel(req.channel());
  filter.prefix  = req.prefix();
  return ctx_.deployment->Subscribe(req.service_id(), std::move(filter));
}

meshdeploy::v1::GetExitCodeResponse ControlService::GetExitCode(const meshdeploy::v1::GetExitCodeRequest& req) {
  meshdeploy::v1::GetExitCodeResponse resp;
  resp.set_exit_code(ctx_.deployment->ExitCode(req.service_id(), req.wait()));
  return resp;
}

meshdeploy::v1::GetWiringResponse ControlService::GetWiring(const meshdeploy::v1::GetWiringRequest& req) const {
  meshdeploy::v1::GetWiringResponse resp;
  *resp.mutable_wiring() = exec::ToProto(ctx_.deployment->Wiring(req.service_id()));
  resp.set_kind(std::string(model::ToString(ctx_.deployment->ServiceKindOf(req.service_id()))));
  return resp;
}

meshdeploy::v1::ListEventsResponse ControlService::ListEvents(const meshdeploy::v1::ListEventsRequest&) const {
  meshdeploy::v1::ListEventsResponse resp;
  for (const auto& event : ctx_.deployment->Events()) {
    auto* out = resp.add_events();
    out->set_kind(std::string(core::ToString(event.kind)));
    out->set_service_id(event.service_id);
    out->set_exit_code(event.exit_code);
    out->set_message(event.message);
    *out->mutable_time() = util::ToProto(event.time);
  }
  return resp;
}

meshdeploy::v1::StopResponse ControlService::Stop(const meshdeploy::v1::StopRequest&) {
  observability::SpanScope span("control.stop");
  MESHDEPLOY_LOG_INFO("Stop requested over control plane", {observability::StringField("deployment", ctx_.deployment->Id())});

  const auto report = ctx_.deployment->Stop();

  meshdeploy::v1::StopResponse resp;
  resp.set_state(std::string(model::ToString(ctx_.deployment->State())));
  for (const auto& failure : report.failures) {
    resp.add_failures(failure);
  }
  if (ctx_.on_stopped) {
    ctx_.on_stopped();
  }
  return resp;
}

meshdeploy::v1::OutputLine ControlService::ToProto(const std::string& service_id, const supervisor::OutputLine& line) {
  meshdeploy::v1::OutputLine out;
  out.set_service_id(service_id);
  out.set_channel(std::string(capability::ToString(line.channel)));
  out.set_line(line.text);
  *out.mutable_time() = util::ToProto(line.time);
  return out;
}

} // namespace meshdeploy::service
