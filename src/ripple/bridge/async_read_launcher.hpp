/* Ripple-Bridge: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "ripple/bridge/file_reader.hpp"
#include "ripple/bridge/read_buffer.hpp"
#include "ripple/util/detail/util_fwd.hpp"
#include <flow/async/x_thread_task_loop.hpp>
#include <flow/error/error.hpp>
#include <flow/log/log.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/noncopyable.hpp>

namespace ripple::bridge
{

// Types.

/**
 * Carries out the asynchronous read protocol: async_read() opens the file, allocates a Raw_buffer sized to it and
 * hands that buffer to the caller *before* anything is read into it; a worker thread then fills the buffer and,
 * once done, announces completion through the `Completion_sink`.  The caller learns of completion only through
 * the sink (at the FFI: a record on the side channel) or, natively, through the returned Read_ticket.
 *
 * ### Protocol per request ###
 *   -# async_read() in the calling thread: open; size `L`; allocate `L + 1` bytes with the last one 0; move the
 *      buffer to `*target`; post the fill to a worker; return.  If the open or the allocation fails, nothing is
 *      posted and the sink is never invoked for this request.
 *   -# In a worker: read up to `L` bytes into the buffer, through a non-owning alias, retrying `EINTR`/`EAGAIN`.
 *   -# Whatever the outcome (full read, short read, error): Read_ticket::mark_ready(); then
 *      `Completion_sink::notify()` with to_wire_request_id(); then Read_ticket::mark_released().  The wire carries
 *      no outcome; a failed fill is logged and leaves the content unspecified.
 *
 * Workers form a bounded pool (`flow::async::Cross_thread_task_loop`); further requests queue behind it with no
 * backpressure to the caller.  Requests complete in no particular order.
 *
 * ### Cancellation and shutdown ###
 * An accepted request cannot be canceled.  The destructor blocks until every accepted request has been released
 * (so none loses its notification) and only then stops the workers.  A read stuck forever in the kernel thus
 * blocks the destructor forever too.
 *
 * ### Thread safety ###
 * async_read() and n_outstanding() are safe to call concurrently on the same `*this`.
 *
 * @tparam Completion_sink
 *         Type that models the Completion_sink concept.  Its notify() is invoked from worker threads concurrently.
 */
template<typename Completion_sink>
class Async_read_launcher :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Sink = Completion_sink;

  // Constants.

  /// Default number of worker threads.
  static constexpr size_t S_DEFAULT_N_WORKERS = 4;

  // Constructors/destructor.

  /**
   * Starts the worker threads.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param sink
   *        Receives one notify() per accepted request.  Must outlive `*this`.
   * @param n_workers
   *        Worker pool size.  Must be at least 1.
   */
  explicit Async_read_launcher(flow::log::Logger* logger_ptr, util::String_view nickname_str, Sink* sink,
                               size_t n_workers = S_DEFAULT_N_WORKERS);

  /// Waits for all accepted requests to reach Read_ticket::State::S_RELEASED; then stops the worker threads.
  ~Async_read_launcher();

  // Methods.

  /**
   * Starts an asynchronous read of the given file, as explained in class doc header.
   *
   * @param path
   *        File to read.
   * @param request_id
   *        The caller's correlation token; it (narrowed) is what the sink receives.
   * @param target
   *        On success receives the not-yet-filled buffer; must not be null.  The caller must not read the
   *        content, nor free the memory, before the request is released.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        as for open_and_allocate().
   * @return Ticket tracking the request; null on error.
   */
  Read_ticket::Ptr async_read(const fs::path& path, request_id_t request_id, Raw_buffer* target,
                              Error_code* err_code = 0);

  /**
   * Number of accepted requests not yet released.
   * @return See above.
   */
  size_t n_outstanding() const;

  /**
   * Worker pool size.
   * @return See above.
   */
  size_t n_workers() const;

  /**
   * Nickname as passed to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// What one fill needs; shared by pointer so that the posted task stays copyable.
  struct Fill_job
  {
    /// Source file, open since async_read().
    Scoped_native_handle m_file;
    /// Non-owning alias of the caller's buffer content.
    util::Blob_mutable m_target;
    /// The request's ticket.
    Read_ticket::Ptr m_ticket;
    /// For logging.
    fs::path m_path;
  };

  // Methods.

  /**
   * Body of the fill task, in a worker thread: steps 2 and 3 of the protocol.
   *
   * @param job
   *        The request.
   */
  void fill(Fill_job* job);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See ctor.
  Sink* const m_sink;

  /// See n_workers().
  const size_t m_n_workers;

  /// Protects #m_n_outstanding.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// Signaled whenever #m_n_outstanding reaches 0.
  boost::condition_variable m_idle_cond;

  /// See n_outstanding().  Protected by #m_mutex.
  size_t m_n_outstanding;

  /// The worker pool.  Stopped explicitly in dtor.
  flow::async::Cross_thread_task_loop m_workers;
}; // class Async_read_launcher

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Completion_sink>
Async_read_launcher<Completion_sink>::Async_read_launcher(flow::log::Logger* logger_ptr,
                                                          util::String_view nickname_str,
                                                          Sink* sink, size_t n_workers) :
  flow::log::Log_context(logger_ptr, Log_component::S_BRIDGE),
  m_nickname(nickname_str),
  m_sink(sink),
  m_n_workers(n_workers),
  m_n_outstanding(0),
  m_workers(logger_ptr, nickname_str, n_workers)
{
  assert(m_sink);
  assert(m_n_workers != 0);

  m_workers.start();
  FLOW_LOG_INFO("Async_read_launcher [" << *this << "]: Started [" << m_n_workers << "] workers.");
}

template<typename Completion_sink>
Async_read_launcher<Completion_sink>::~Async_read_launcher()
{
  using flow::util::Lock_guard;

  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    if (m_n_outstanding != 0)
    {
      FLOW_LOG_INFO("Async_read_launcher [" << *this << "]: Shutting down.  Awaiting completion of "
                    "[" << m_n_outstanding << "] outstanding requests.");
    }
    m_idle_cond.wait(lock, [&]() -> bool { return m_n_outstanding == 0; });
  }

  FLOW_LOG_INFO("Async_read_launcher [" << *this << "]: Shutting down.  No requests outstanding; stopping workers.");
  m_workers.stop();
}

template<typename Completion_sink>
Read_ticket::Ptr Async_read_launcher<Completion_sink>::async_read(const fs::path& path, request_id_t request_id,
                                                                  Raw_buffer* target, Error_code* err_code)
{
  using flow::util::Lock_guard;
  using std::make_shared;

  Read_ticket::Ptr ticket;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Read_ticket::Ptr
           { return async_read(path, request_id, target, actual_err_code); },
         &ticket, err_code, "Async_read_launcher::async_read()"))
  {
    return ticket;
  }
  // else if (err_code): Do not throw; emit *err_code.

  assert(target);

  Raw_buffer buf;
  auto file = open_and_allocate(get_logger(), path, &buf, err_code);
  if (*err_code)
  {
    FLOW_LOG_TRACE("Async_read_launcher [" << *this << "]: Request [" << request_id << "] for [" << path << "] "
                   "rejected: [" << *err_code << "] [" << err_code->message() << "].  No completion will follow.");
    return ticket;
  }
  // else

  ticket = make_shared<Read_ticket>(request_id, buf.size());
  const auto job = make_shared<Fill_job>();
  job->m_file = std::move(file);
  job->m_target = buf.mutable_buffer();
  job->m_ticket = ticket;
  job->m_path = path;

  FLOW_LOG_TRACE("Async_read_launcher [" << *this << "]: Request [" << request_id << "] for [" << path << "] "
                 "accepted: buffer [" << buf << "] handed off; fill posted.");

  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    ++m_n_outstanding;
  }

  // Ownership goes to the caller now; the job keeps only the alias.
  *target = std::move(buf);

  m_workers.post([this, job]() { fill(job.get()); });

  return ticket;
} // Async_read_launcher::async_read()

template<typename Completion_sink>
void Async_read_launcher<Completion_sink>::fill(Fill_job* job)
{
  using util::read_fully;
  using flow::util::Lock_guard;

  auto& ticket = *job->m_ticket;

  Error_code fill_err_code;
  const auto n_read = read_fully(job->m_file.get(), job->m_target, &fill_err_code);
  job->m_file.reset();

  if (fill_err_code)
  {
    FLOW_LOG_WARNING("Async_read_launcher [" << *this << "]: Request [" << ticket.request_id() << "]: reading "
                     "[" << job->m_path << "] failed after [" << n_read << "] of [" << ticket.size() << "] bytes: "
                     "[" << fill_err_code << "] [" << fill_err_code.message() << "].  Completion will be signaled "
                     "anyway; buffer content is unspecified.");
  }
  else if (n_read != ticket.size())
  {
    fill_err_code = error::Code::S_FILE_SHORT_READ;
    FLOW_LOG_WARNING("Async_read_launcher [" << *this << "]: Request [" << ticket.request_id() << "]: "
                     "[" << job->m_path << "] yielded [" << n_read << "] of [" << ticket.size() << "] bytes.  "
                     "Completion will be signaled anyway; the rest of the buffer is unspecified.");
  }
  else
  {
    FLOW_LOG_TRACE("Async_read_launcher [" << *this << "]: Request [" << ticket.request_id() << "]: read "
                   "[" << n_read << "] bytes of [" << job->m_path << "].");
  }

  ticket.mark_ready(fill_err_code, n_read);

  // Past this point the caller may read and free; do not touch job->m_target again.
  m_sink->notify(to_wire_request_id(get_logger(), ticket.request_id()));

  ticket.mark_released();

  // Notify under the lock: once the count hits 0 the dtor may proceed and destroy m_idle_cond.
  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  assert(m_n_outstanding != 0);
  if (--m_n_outstanding == 0)
  {
    m_idle_cond.notify_all();
  }
} // Async_read_launcher::fill()

template<typename Completion_sink>
size_t Async_read_launcher<Completion_sink>::n_outstanding() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_n_outstanding;
}

template<typename Completion_sink>
size_t Async_read_launcher<Completion_sink>::n_workers() const
{
  return m_n_workers;
}

template<typename Completion_sink>
const std::string& Async_read_launcher<Completion_sink>::nickname() const
{
  return m_nickname;
}

template<typename Completion_sink>
std::ostream& operator<<(std::ostream& os, const Async_read_launcher<Completion_sink>& val)
{
  return os << '[' << val.nickname() << "]@" << &val;
}

} // namespace ripple::bridge
