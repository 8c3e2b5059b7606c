#ifndef _liblaminar_h_
#define _liblaminar_h_

#include <ostream>
#include <iostream>

// Otherwise #defines like M_PI are undeclared under Visual Studio
#ifndef _USE_MATH_DEFINES
#define _USE_MATH_DEFINES
#endif

#include <math.h>
#include <algorithm>
#include <queue>
#include <sstream>
#include <vector>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include <cstdint>

#ifdef _MSC_VER
#include <limits>
#define NOMINMAX
#endif
/* Implementation of CONFESS("foo"): */
#ifdef _MSC_VER
	#define CONFESS(...) confess_at(__FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)
#else
	#define CONFESS(...) confess_at(__FILE__, __LINE__, __func__, __VA_ARGS__)
#endif
/// Logs the failed invariant and throws std::runtime_error.
[[noreturn]] void confess_at(const char *file, int line, const char *func, const char *pat, ...);
/* End implementation of CONFESS("foo"): */

namespace Laminar {

constexpr auto LAMINAR_VERSION = "0.4.0";

#ifndef LAMINAR_BUILD_COMMIT
#define LAMINAR_BUILD_COMMIT (Unknown revision)
#endif 
#define VER1_(x) #x
#define VER_(x) VER1_(x)
#define BUILD_COMMIT VER_(LAMINAR_BUILD_COMMIT)

#ifdef _WIN32
typedef int64_t coord_t;
typedef double coordf_t;
#else 
typedef long coord_t;
typedef double coordf_t;
#endif

// Scaling factor for a conversion from coord_t to coordf_t: 10e-6
// 0..4294mm with 1nm resolution for a 32bit integer.
constexpr auto SCALING_FACTOR = 0.000001;
inline constexpr coord_t  scale_(const coordf_t &val) { return val / SCALING_FACTOR; }
inline constexpr coordf_t unscale(const coord_t &val) { return val * SCALING_FACTOR; }

constexpr auto EPSILON = 1e-4;
constexpr auto SCALED_EPSILON = scale_(EPSILON);
constexpr auto PI = 3.141592653589793238;

// Regions smaller than this (mm^2) are dropped after slicing.
constexpr coordf_t MIN_REGION_AREA = 1e-6;
// Reference filament density used by the estimators, g/mm^3 (PLA, 1.24 g/cm^3).
constexpr coordf_t PLA_DENSITY = 1.24 / 1000.0;
// Heating allowance added to every time estimate, seconds.
constexpr coordf_t HEATUP_TIME = 5 * 60;

constexpr float CLIPPER_OFFSET_SCALE = 100000.0;

template <typename T>
inline T sqr(T x) { return x * x; }

template <class T>
inline void append_to(std::vector<T> &dst, const std::vector<T> &src)
{
    dst.insert(dst.end(), src.begin(), src.end());
}

template <class T> void
_parallelize_do(std::queue<T>* queue, boost::mutex* queue_mutex, boost::function<void(T)> func)
{
    while (true) {
        T i;
        {
            boost::lock_guard<boost::mutex> l(*queue_mutex);
            if (queue->empty()) return;
            i = queue->front();
            queue->pop();
        }
        func(i);
        boost::this_thread::interruption_point();
    }
}

template <class T> void
parallelize(std::queue<T> queue, boost::function<void(T)> func,
    int threads_count = boost::thread::hardware_concurrency())
{
    if (threads_count == 0) threads_count = 2;
    boost::mutex queue_mutex;
    boost::thread_group workers;
    for (int i = 0; i < std::min(threads_count, (int)queue.size()); i++)
        workers.add_thread(new boost::thread(&_parallelize_do<T>, &queue, &queue_mutex, func));
    workers.join_all();
}

/// Run func over [start, end] (inclusive) on a pool of threads.
template <class T> void
parallelize(T start, T end, boost::function<void(T)> func,
    int threads_count = boost::thread::hardware_concurrency())
{
    std::queue<T> queue;
    for (T i = start; i <= end; ++i) queue.push(i);
    parallelize(queue, func, threads_count);
}

} // namespace Laminar

using namespace Laminar;

#endif
