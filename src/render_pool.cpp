#include "render_pool.hpp"
#include "logging/logger.hpp"

#include <map>
#include <mutex>
#include <future>
#include <condition_variable>
#include <boost/asio.hpp>
#include <boost/assert.hpp>
#include <boost/bind.hpp>
#include <boost/format.hpp>
#include <boost/thread.hpp>

namespace tilepool {

namespace {

// keys are often whole map definitions, far too long for a log line.
std::string abbreviate(const std::string &key) {
  const std::size_t max_length = 48;
  if (key.size() <= max_length) {
    return key;
  }
  return key.substr(0, max_length) + (boost::format("... (%1% bytes)") % key.size()).str();
}

// runs the io_service until it has no more work, making sure that
// no exception escapes the thread.
void run_service(boost::asio::io_service *service, const char *name) {
  try {
    service->run();

  } catch (const std::exception &e) {
    LOG_ERROR(boost::format("%1% thread terminating due to: %2%") % name % e.what());

  } catch (...) {
    LOG_ERROR(boost::format("%1% thread terminating due to UNKNOWN ERROR") % name);
  }
}

} // anonymous namespace

pool_exhausted::pool_exhausted(const std::string &what)
  : std::runtime_error(what) {
}

struct render_pool::impl {
  impl(std::shared_ptr<renderer_factory> factory, const pool_options &options);
  ~impl();

  render_channel acquire_or_create(const std::string &key);

  std::size_t size() const;
  bool contains(const std::string &key) const;

  const pool_options m_options;

private:
  struct entry {
    entry(const render_channel &channel_, const std::shared_future<void> &constructed_)
      : channel(channel_), constructed(constructed_) {}

    render_channel channel;
    // becomes ready once the worker has built its renderer, or holds
    // the construction_failure if it couldn't.
    std::shared_future<void> constructed;
  };

  typedef std::map<std::string, entry> entry_map;

  void worker_loop(const std::string &key,
                   std::shared_ptr<request_queue> queue,
                   std::shared_ptr<std::promise<void> > constructed);
  std::unique_ptr<renderer> construct(const std::string &key, std::promise<void> &constructed);
  void serve(const std::string &key, renderer &r, request_queue &queue);
  render_response render_one(renderer &r, const extent &bbox);
  void evict(const std::string &key, request_queue &queue);
  void reap(const std::string &key);
  void cleanup();

  std::shared_ptr<renderer_factory> m_factory;

  // guards everything below, and the call to global_cleanup.
  mutable std::mutex m_mutex;
  std::condition_variable m_slot_freed;
  entry_map m_entries;
  std::size_t m_free_slots;
  bool m_shutdown;

  // one thread per worker slot, each running at most one worker
  // loop at a time.
  boost::asio::io_service m_worker_service;
  std::unique_ptr<boost::asio::io_service::work> m_worker_work;
  boost::thread_group m_worker_threads;

  // a single thread draining eviction notifications.
  boost::asio::io_service m_reaper_service;
  std::unique_ptr<boost::asio::io_service::work> m_reaper_work;
  boost::thread m_reaper_thread;
};

render_pool::impl::impl(std::shared_ptr<renderer_factory> factory, const pool_options &options)
  : m_options(options),
    m_factory(factory),
    m_free_slots(options.threads),
    m_shutdown(false),
    m_worker_work(new boost::asio::io_service::work(m_worker_service)),
    m_reaper_work(new boost::asio::io_service::work(m_reaper_service)) {

  if (!m_factory) {
    throw std::invalid_argument("Render pool needs a renderer factory.");
  }
  if (m_options.threads == 0) {
    throw std::invalid_argument("Render pool needs at least one worker thread.");
  }

  for (std::size_t i = 0; i < m_options.threads; ++i) {
    m_worker_threads.create_thread(boost::bind(&run_service, &m_worker_service, "Worker"));
  }
  m_reaper_thread = boost::thread(boost::bind(&run_service, &m_reaper_service, "Reaper"));

  LOG_DEBUG(boost::format("Render pool started with %1% worker slots, idle timeout %2%ms, "
                          "%3% acquisition.")
            % m_options.threads % m_options.idle_timeout.count() % m_options.policy);
}

render_pool::impl::~impl() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shutdown = true;
    for (auto &kv : m_entries) {
      kv.second.channel.close();
    }
  }
  m_slot_freed.notify_all();

  // workers see their channels closed, evict themselves and post to
  // the reaper, so they have to finish before the reaper is stopped.
  m_worker_work.reset();
  m_worker_threads.join_all();

  m_reaper_work.reset();
  m_reaper_thread.join();

  BOOST_ASSERT(m_entries.empty());

  // the process may be exiting with renderers having been alive
  // recently, so clean up regardless of what the reaper did.
  std::lock_guard<std::mutex> lock(m_mutex);
  cleanup();
}

render_channel render_pool::impl::acquire_or_create(const std::string &key) {
  boost::optional<render_channel> channel;
  std::shared_future<void> constructed;

  {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (!channel) {
      if (m_shutdown) {
        throw std::runtime_error("Render pool is shutting down.");
      }

      entry_map::iterator itr = m_entries.find(key);
      if (itr != m_entries.end()) {
        channel = itr->second.channel;
        constructed = itr->second.constructed;

      } else if (m_free_slots > 0) {
        --m_free_slots;

        render_channel new_channel;
        std::shared_ptr<std::promise<void> > promise = std::make_shared<std::promise<void> >();
        constructed = promise->get_future().share();
        m_entries.insert(std::make_pair(key, entry(new_channel, constructed)));

        m_worker_service.post(boost::bind(&impl::worker_loop, this, key,
                                          new_channel.queue(), promise));
        channel = new_channel;

      } else if (m_options.policy == acquire_policy::non_blocking) {
        throw pool_exhausted((boost::format("All %1% worker slots are in use.")
                              % m_options.threads).str());

      } else {
        m_slot_freed.wait(lock);
      }
    }
  }

  // rethrows construction_failure, if there was one.
  constructed.get();

  return *channel;
}

std::size_t render_pool::impl::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_entries.size();
}

bool render_pool::impl::contains(const std::string &key) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_entries.count(key) > 0;
}

void render_pool::impl::worker_loop(const std::string &key,
                                    std::shared_ptr<request_queue> queue,
                                    std::shared_ptr<std::promise<void> > constructed) {
  try {
    std::unique_ptr<renderer> r = construct(key, *constructed);
    if (r) {
      serve(key, *r, *queue);
    }
    // the renderer must be gone before the entry is, otherwise the
    // reaper could clean up underneath it.

  } catch (const std::exception &e) {
    LOG_ERROR(boost::format("Worker for %1% terminating due to: %2%")
              % abbreviate(key) % e.what());

  } catch (...) {
    LOG_ERROR(boost::format("Worker for %1% terminating due to UNKNOWN ERROR")
              % abbreviate(key));
  }

  evict(key, *queue);
}

std::unique_ptr<renderer> render_pool::impl::construct(const std::string &key,
                                                       std::promise<void> &constructed) {
  std::unique_ptr<renderer> r;

  try {
    r = m_factory->construct(key);
    if (!r) {
      throw construction_failure("Renderer factory returned nothing.");
    }
    LOG_DEBUG(boost::format("Constructed renderer for %1%") % abbreviate(key));
    constructed.set_value();

  } catch (const construction_failure &e) {
    LOG_WARNING(boost::format("Unable to construct renderer for %1%: %2%")
                % abbreviate(key) % e.what());
    r.reset();
    constructed.set_exception(std::current_exception());

  } catch (const std::exception &e) {
    LOG_WARNING(boost::format("Unable to construct renderer for %1%: %2%")
                % abbreviate(key) % e.what());
    r.reset();
    constructed.set_exception(std::make_exception_ptr(construction_failure(e.what())));

  } catch (...) {
    LOG_WARNING(boost::format("Unable to construct renderer for %1%: UNKNOWN ERROR")
                % abbreviate(key));
    r.reset();
    constructed.set_exception(std::make_exception_ptr(construction_failure("unknown error")));
  }

  return r;
}

void render_pool::impl::serve(const std::string &key, renderer &r, request_queue &queue) {
  while (true) {
    render_request req;
    request_queue::recv_status status = queue.recv(req, m_options.idle_timeout);

    if (status == request_queue::recv_status::timeout) {
      LOG_INFO(boost::format("Worker for %1% idle for %2%ms, exiting.")
               % abbreviate(key) % m_options.idle_timeout.count());
      break;

    } else if (status == request_queue::recv_status::closed) {
      LOG_DEBUG(boost::format("Worker for %1% disconnected, exiting.") % abbreviate(key));
      break;
    }

    req.reply.set_value(render_one(r, req.bbox));
  }
}

render_response render_pool::impl::render_one(renderer &r, const extent &bbox) {
  try {
    return render_response(r.render(bbox));

  } catch (const std::exception &e) {
    LOG_WARNING(boost::format("Unable to render %1%: %2%") % bbox % e.what());
    return render_response(render_result(render_status::render_failed, e.what()));

  } catch (...) {
    LOG_ERROR(boost::format("Unable to render %1%: UNKNOWN ERROR") % bbox);
    return render_response(render_result(render_status::render_failed, "unknown error"));
  }
}

void render_pool::impl::evict(const std::string &key, request_queue &queue) {
  // anyone still holding the channel now fails straight away.
  queue.close();

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    entry_map::iterator itr = m_entries.find(key);
    BOOST_ASSERT_MSG(itr != m_entries.end(), "Evicted key is missing from the render pool.");
    if (itr != m_entries.end()) {
      m_entries.erase(itr);
    }
    ++m_free_slots;
  }
  m_slot_freed.notify_all();

  m_reaper_service.post(boost::bind(&impl::reap, this, key));
}

void render_pool::impl::reap(const std::string &key) {
  std::lock_guard<std::mutex> lock(m_mutex);
  LOG_DEBUG(boost::format("Evicted %1%, %2% renderers remain.")
            % abbreviate(key) % m_entries.size());

  // holding the lock keeps new workers from starting until the
  // cleanup is done.
  if (m_entries.empty()) {
    cleanup();
  }
}

void render_pool::impl::cleanup() {
  try {
    LOG_INFO("No renderers alive, running global cleanup.");
    m_factory->global_cleanup();

  } catch (const std::exception &e) {
    LOG_ERROR(boost::format("Global cleanup failed: %1%") % e.what());
  }
}

render_pool::render_pool(std::shared_ptr<renderer_factory> factory, const pool_options &options)
  : m_impl(new impl(factory, options)) {
}

render_pool::~render_pool() {
}

render_channel render_pool::acquire_or_create(const std::string &key) {
  return m_impl->acquire_or_create(key);
}

std::size_t render_pool::size() const {
  return m_impl->size();
}

bool render_pool::contains(const std::string &key) const {
  return m_impl->contains(key);
}

std::size_t render_pool::slots() const {
  return m_impl->m_options.threads;
}

} // namespace tilepool
