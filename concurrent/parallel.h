#ifndef CDUCKLING_PARALLEL_H
#define CDUCKLING_PARALLEL_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

using ThreadNumber = uint16_t;

struct ParallelContext {
	// a number between 0 and n - 1 (n being the number of threads)
	// indicating the thread we're currently in. 0 is any thread that
	// is not a worker, including the one that called Parallel::init().
	ThreadNumber thread_number;
};

// one call of parallelize(): n indices handed out to whichever threads
// join in, the calling thread first among them.
class ParallelTask {
private:
	std::mutex m_error_mutex;
	std::exception_ptr m_error;

public:
	using Lambda = std::function<void(size_t)>;

	const Lambda &lambda;
	const size_t n;

	std::atomic<size_t> index;

	// threads inside run(), the owner included. guarded by the Parallel mutex.
	size_t busy;
	std::condition_variable idle;

	inline ParallelTask(const Lambda &lambda_, size_t n_) :
		lambda(lambda_), n(n_), busy(1) {

		index.store(0, std::memory_order_relaxed);
	}

	// runs lambda on indices until none are left. an exception stops the
	// task and is kept for the owner to rethrow.
	void run();

	void rethrow();
};

class Parallel {
public:
	enum {
		MaxParallelism = 8
	};

private:
	static Parallel *s_instance;

	static thread_local ParallelContext t_context;

	std::mutex m_mutex;
	std::condition_variable m_work;
	std::deque<ParallelTask*> m_queue;
	bool m_quit;

	std::vector<std::thread> m_threads;

	Parallel(size_t threads);

	~Parallel();

	void work(ThreadNumber thread_number);

	bool enqueue(ParallelTask *task);

	void remove(ParallelTask *task);

	// waits until no worker is inside the task anymore.
	void finish(ParallelTask *task);

public:
	// starts the worker threads; 0 picks a number from the hardware.
	static void init(size_t threads = 0);

	static void shutdown();

	static inline Parallel *instance() {
		return s_instance;
	}

	static inline const ParallelContext &context() {
		return t_context;
	}

	// number of threads that may run a task at once, the caller included.
	inline size_t concurrency() const {
		return m_threads.size() + 1;
	}

	void parallelize(const ParallelTask::Lambda &lambda, size_t n);
};

// calls f(i) for i = 0, ..., n - 1, spread over the worker threads if
// Parallel has been initialized, sequentially otherwise. f must be
// thread safe. the first exception thrown by f is rethrown here.
template<typename F>
inline void parallelize(const F &f, size_t n) {
	if (n > 0) {
		Parallel * const parallel = Parallel::instance();

		if (n == 1 || parallel == nullptr) {
			for (size_t i = 0; i < n; i++) {
				f(i);
			}
		} else {
			// a single reference capture keeps the std::function
			// free of dynamic allocation.
			ParallelTask::Lambda lambda = [&f] (size_t i) {
				f(i);
			};
			parallel->parallelize(lambda, n);
		}
	}
}

#endif // CDUCKLING_PARALLEL_H
