#include "parallel.h"

#include <algorithm>

Parallel *Parallel::s_instance = nullptr;

thread_local ParallelContext Parallel::t_context = {0};

// tasks waiting for workers. parallelize() calls beyond this run on
// their calling thread alone.
constexpr size_t queue_size = 32;

void ParallelTask::run() {
	try {
		while (true) {
			const size_t i = index.fetch_add(1, std::memory_order_relaxed);
			if (i >= n) {
				break;
			}
			lambda(i);
		}
	} catch (...) {
		{
			std::lock_guard<std::mutex> lock(m_error_mutex);
			if (!m_error) {
				m_error = std::current_exception();
			}
		}
		// no thread picks up further indices.
		index.store(n, std::memory_order_relaxed);
	}
}

void ParallelTask::rethrow() {
	std::exception_ptr error;
	{
		std::lock_guard<std::mutex> lock(m_error_mutex);
		error = m_error;
	}
	if (error) {
		std::rethrow_exception(error);
	}
}

void Parallel::init(size_t threads) {
	if (s_instance) {
		return;
	}

	if (threads == 0) {
		threads = size_t(std::max(1L, long(std::thread::hardware_concurrency()) - 1L));
	}
	threads = std::min(threads, size_t(MaxParallelism - 1));

	s_instance = new Parallel(threads);
}

void Parallel::shutdown() {
	delete s_instance;
	s_instance = nullptr;
}

Parallel::Parallel(size_t threads) : m_quit(false) {
	for (size_t i = 0; i < threads; i++) {
		m_threads.emplace_back(&Parallel::work, this, ThreadNumber(i + 1));
	}
}

Parallel::~Parallel() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_quit = true;
	}
	m_work.notify_all();

	for (std::thread &thread : m_threads) {
		thread.join();
	}
}

bool Parallel::enqueue(ParallelTask *task) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_queue.size() >= queue_size) {
			return false;
		}
		m_queue.push_back(task);
	}
	m_work.notify_all();
	return true;
}

void Parallel::remove(ParallelTask *task) {
	const auto i = std::find(m_queue.begin(), m_queue.end(), task);
	if (i != m_queue.end()) {
		m_queue.erase(i);
	}
}

void Parallel::finish(ParallelTask *task) {
	std::unique_lock<std::mutex> lock(m_mutex);
	remove(task);
	task->busy -= 1;
	task->idle.wait(lock, [task] () {
		return task->busy == 0;
	});
}

void Parallel::parallelize(const ParallelTask::Lambda &lambda, size_t n) {
	// the calling thread works on its own task too, so if no worker is
	// free this is just a sequential execution.

	ParallelTask task(lambda, n);

	const bool enqueued = enqueue(&task);

	task.run();

	if (enqueued) {
		finish(&task);
	}

	task.rethrow();
}

void Parallel::work(ThreadNumber thread_number) {
	t_context.thread_number = thread_number;

	std::unique_lock<std::mutex> lock(m_mutex);

	while (true) {
		m_work.wait(lock, [this] () {
			return m_quit || !m_queue.empty();
		});

		if (m_quit) {
			break;
		}

		// take the oldest task and move it to the back, so that
		// concurrent parses share the workers.
		ParallelTask * const task = m_queue.front();
		m_queue.pop_front();
		m_queue.push_back(task);
		task->busy += 1;

		lock.unlock();
		task->run();
		lock.lock();

		// all indices are handed out now.
		remove(task);

		task->busy -= 1;
		if (task->busy == 0) {
			task->idle.notify_all();
		}
	}
}
