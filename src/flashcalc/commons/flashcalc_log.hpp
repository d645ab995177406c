/**
 * @file flashcalc_log.hpp
 * @brief Engine logging, forwarded to the bot that loaded flashcalc_ext
 *
 * The engine does not own any log output. Messages go to a Python
 * callable handed over with log_register_sink(), and are called back as
 * sink(level, message), level being one of the log_level values exported
 * by the module. Until a sink is registered nothing is formatted nor
 * emitted, which is how the C++ test programs run.
 *
 * log_trace() ... log_error() take a boost::format string and its
 * arguments:
 *
 *     log_info("rejected: %1%", decision);
 *
 * Arguments are only evaluated if the level passes the threshold.
 *
 * What gets logged where:
 * - error: a hard failure escaping evaluate()
 * - info: every verdict, and non viable redeems
 * - debug: decision breakdowns, rebalance quotes, swap leftovers
 * - trace: simulated venue swaps
 */

#pragma once

#include <boost/format.hpp>
#include <boost/python/object_fwd.hpp>
#include <string>
#include <utility>

typedef enum {
    log_level_trace,
    log_level_debug,
    log_level_info,
    log_level_warning,
    log_level_error,
} log_level;

/**
 * @brief true if a sink is registered and @p lvl passes the threshold
 */
bool log_trigger(log_level lvl);

log_level log_get_level();

/**
 * @brief sets the threshold. Values out of the log_level range are ignored.
 */
void log_set_level(log_level lvl);

/**
 * @brief sets the Python callable receiving the log lines. None unregisters it.
 */
void log_register_sink(boost::python::object sink);

bool log_has_sink();

/**
 * @brief hands an already formatted line to the sink
 */
void log_emit_ll(log_level lvl, const std::string &msg);


/**
 * @brief boost::format in one call. strfmt("%1% of %2%", a, b)
 *
 * Also used to build exception messages.
 */
inline std::string strfmt(const char *fmt)
{
    return boost::str(boost::format(fmt));
}

template<typename T, typename ... Args>
std::string strfmt(const char *fmt, const T &first, Args&& ... args)
{
    boost::format f(fmt);
    f % first;
    using expand = int[];
    (void)expand{0, ((void)(f % std::forward<Args>(args)), 0)...};
    return boost::str(f);
}


#define log_emit(lvl, ...)                                              \
    do {                                                                \
        if (log_trigger(lvl)) log_emit_ll(lvl, strfmt(__VA_ARGS__));    \
    } while (0)

#define log_trace(...)   log_emit(log_level_trace  , __VA_ARGS__)
#define log_debug(...)   log_emit(log_level_debug  , __VA_ARGS__)
#define log_info(...)    log_emit(log_level_info   , __VA_ARGS__)
#define log_warning(...) log_emit(log_level_warning, __VA_ARGS__)
#define log_error(...)   log_emit(log_level_error  , __VA_ARGS__)
