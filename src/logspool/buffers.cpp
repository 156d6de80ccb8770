//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/buffers.hpp>
//

#include <logspool/checkpoint.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

namespace logspool {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Buffers::Buffers(const fs::path& checkpoint_path, BufferConfigurationMap configurations,
                 const BuffersOptions& options)
    : checkpoint_path_{checkpoint_path}
    , configurations_{std::move(configurations)}
    , options_{options}
    , ready_queue_{options.id_allocator()}
{
  using batt::Token;

  this->metrics_.export_to(global_metric_registry(),
                           MetricLabelSet{
                               MetricLabel{Token{"object_type"}, Token{"logspool_Buffers"}},
                               MetricLabel{Token{"name"}, Token{this->options_.name()}},
                           });

  this->restore_from_checkpoint();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Buffers::~Buffers() noexcept
{
  if (!this->closed_.load()) {
    LOGSPOOL_LOG_WARNING() << "Buffers destroyed without close(); "
                           << this->ready_queue_.size()
                           << " ready buffer(s) will not be checkpointed to "
                           << this->checkpoint_path_;
  }

  this->metrics_.unexport_from(global_metric_registry());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void Buffers::restore_from_checkpoint()
{
  StatusOr<bool> exists = file_exists(this->checkpoint_path_);
  if (!exists.ok()) {
    LOGSPOOL_LOG_WARNING() << "Could not check for checkpoint " << this->checkpoint_path_ << ": "
                           << exists.status();
  } else if (*exists) {
    StatusOr<std::vector<std::unique_ptr<LogBuffer>>> loaded =
        ::logspool::load_checkpoint(this->checkpoint_path_);

    if (!loaded.ok()) {
      LOGSPOOL_LOG_WARNING() << "Ignoring unreadable checkpoint " << this->checkpoint_path_ << ": "
                             << loaded.status();
    } else {
      this->ready_queue_.restore(std::move(*loaded));
    }

    LOGSPOOL_WARN_IF_NOT_OK(delete_file(this->checkpoint_path_.string()));
  }

  LOGSPOOL_LOG_INFO() << "unsent buffers: " << this->ready_queue_.size();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Buffers::put(const LogId& log_id, const ConstBuffer& bytes)
{
  std::shared_lock<std::shared_mutex> lifecycle_lock{this->lifecycle_mutex_};

  if (this->closed_.load()) {
    return make_status(StatusCode::kBuffersClosed);
  }

  BATT_ASSIGN_OK_RESULT(const BufferConfiguration* config, this->resolve_configuration(log_id));

  Slot& slot = this->slot_for(log_id.lock_key());
  {
    std::unique_lock<std::mutex> slot_lock{slot.mutex};

    if (!slot.current) {
      BATT_ASSIGN_OK_RESULT(slot.current, this->cache_.acquire(log_id, config->buffer_size));
    }

    if (bytes.size() > slot.current->payload_capacity()) {
      LOGSPOOL_LOG_ERROR() << "Record can never fit in a buffer; " << BATT_INSPECT(bytes.size())
                           << BATT_INSPECT(config->buffer_size)
                           << BATT_INSPECT(slot.current->header_length()) << " log_id=" << log_id;
      return make_status(StatusCode::kRecordTooLarge);
    }

    if (!slot.current->available(bytes.size())) {
      this->enclose(std::move(slot.current));
      BATT_ASSIGN_OK_RESULT(slot.current, this->cache_.acquire(log_id, config->buffer_size));
    }

    slot.current->append(bytes);
  }

  this->metrics_.put_count.add(1);
  this->metrics_.put_bytes.add(bytes.size());

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<const BufferConfiguration*> Buffers::resolve_configuration(const LogId& log_id)
{
  std::unique_lock<std::mutex> lock{this->config_mutex_};

  auto iter = this->config_for_log_id_.find(log_id);
  if (iter != this->config_for_log_id_.end()) {
    return iter->second;
  }

  StatusOr<const BufferConfiguration*> config = this->configurations_.find(log_id.log_type());
  if (!config.ok()) {
    LOGSPOOL_LOG_ERROR() << "No buffer configuration pattern matches " << log_id;
    return config;
  }

  this->config_for_log_id_.emplace(log_id, *config);

  return config;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
auto Buffers::slot_for(const std::string& lock_key) -> Slot&
{
  std::unique_lock<std::mutex> lock{this->slots_mutex_};

  std::unique_ptr<Slot>& slot = this->slots_[lock_key];
  if (!slot) {
    slot = std::make_unique<Slot>();
  }
  return *slot;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void Buffers::enclose(std::unique_ptr<LogBuffer> buffer)
{
  this->ready_queue_.enclose(std::move(buffer));
  this->metrics_.enclosed_count.add(1);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void Buffers::flush()
{
  std::shared_lock<std::shared_mutex> lifecycle_lock{this->lifecycle_mutex_};

  this->flush_impl();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void Buffers::flush_impl()
{
  std::vector<Slot*> slots;
  {
    std::unique_lock<std::mutex> lock{this->slots_mutex_};

    slots.reserve(this->slots_.size());
    for (auto& [lock_key, slot] : this->slots_) {
      slots.emplace_back(slot.get());
    }
  }

  for (Slot* slot : slots) {
    std::unique_lock<std::mutex> slot_lock{slot->mutex};

    if (!slot->current) {
      continue;
    }
    if (slot->current->is_empty()) {
      this->cache_.release(std::move(slot->current));
    } else {
      this->enclose(std::move(slot->current));
    }
    BATT_CHECK(slot->current == nullptr);
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize Buffers::for_each_ready_data(const ConsumeFn& consume)
{
  std::unique_lock<std::mutex> drain_lock{this->drain_mutex_};

  if (this->closed_.load()) {
    return 0;
  }

  this->flush();

  const usize backlog = this->ready_queue_.size();
  this->metrics_.ready_buffer_count.set(backlog);
  LOGSPOOL_VLOG(1) << "buffers to go " << backlog;

  const usize drained_count = this->ready_queue_.drain(
      consume,
      [this](std::unique_ptr<LogBuffer> buffer) {
        this->cache_.release(std::move(buffer));
      },
      [this] {
        return !this->closed_.load();
      });

  this->metrics_.drained_count.add(drained_count);

  return drained_count;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Buffers::close()
{
  std::unique_lock<std::mutex> drain_lock{this->drain_mutex_};
  std::unique_lock<std::shared_mutex> lifecycle_lock{this->lifecycle_mutex_};

  if (this->closed_.exchange(true)) {
    LOGSPOOL_LOG_ERROR() << "Buffers::close called more than once; " << this->checkpoint_path_;
    return make_status(StatusCode::kBuffersAlreadyClosed);
  }

  this->flush_impl();

  LOGSPOOL_LOG_INFO() << "writing " << this->ready_queue_.size() << " unsent buffers to "
                      << this->checkpoint_path_;

  BATT_REQUIRE_OK(save_checkpoint(this->checkpoint_path_, this->ready_queue_))
      << "Could not write checkpoint; " << BATT_INSPECT(this->checkpoint_path_);

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool Buffers::is_empty() const
{
  return this->ready_queue_.is_empty();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize Buffers::ready_buffer_count() const
{
  return this->ready_queue_.size();
}

}  // namespace logspool
