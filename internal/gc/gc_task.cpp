#include "internal/gc/gc_task.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace bay::gc {

using bay::observability::IntField;
using bay::observability::StringField;

GcResult GcTask::Execute() {
  GcResult result;
  result.task = Name();

  observability::SpanScope span(std::string("bay.gc.") + Name());
  const auto               started = std::chrono::steady_clock::now();
  try {
    Collect(result);
  } catch (const std::exception& e) {
    ++result.errors;
    span.RecordException(e.what());
    BAY_LOG_ERROR("gc task aborted", {StringField("task", Name()), StringField("error", e.what())});
  }
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

  span.SetAttribute("cleaned", static_cast<int64_t>(result.cleaned));
  span.SetAttribute("errors", static_cast<int64_t>(result.errors));
  observability::Metrics::Instance().RecordGcRun(Name(), result.cleaned, result.errors, static_cast<double>(result.duration.count()));

  if (result.cleaned > 0 || result.errors > 0) {
    BAY_LOG_INFO("gc task finished", {StringField("task", Name()), IntField("cleaned", static_cast<int64_t>(result.cleaned)),
                                      IntField("skipped", static_cast<int64_t>(result.skipped)),
                                      IntField("errors", static_cast<int64_t>(result.errors)),
                                      IntField("duration_ms", static_cast<int64_t>(result.duration.count()))});
  } else {
    BAY_LOG_DEBUG("gc task finished", {StringField("task", Name()), IntField("skipped", static_cast<int64_t>(result.skipped))});
  }
  return result;
}

void GcTask::Item(GcResult& result, const std::string& item, const std::function<bool()>& reclaim) {
  try {
    bool reclaimed = false;
    core::RetryOnError(item_retry_, [&] { reclaimed = reclaim(); });
    if (reclaimed) {
      ++result.cleaned;
    } else {
      ++result.skipped;
    }
  } catch (const std::exception& e) {
    ++result.errors;
    BAY_LOG_WARN("gc item failed", {StringField("task", Name()), StringField("item", item), StringField("error", e.what())});
  }
}

} // namespace bay::gc
