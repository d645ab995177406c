#include "flashcalc_log.hpp"
#include <boost/python.hpp>
#include <boost/python/object.hpp>

// heap allocated on first registration: a static boost::python::object
// would be destroyed after the interpreter, when the module is unloaded
struct sink_holder {
    boost::python::object callable;
};

static sink_holder *m_sink = nullptr;
static log_level m_threshold = log_level_info;


bool log_has_sink()
{
    return m_sink != nullptr && !m_sink->callable.is_none();
}

bool log_trigger(log_level lvl)
{
    return lvl >= m_threshold && log_has_sink();
}

log_level log_get_level()
{
    return m_threshold;
}

void log_set_level(log_level lvl)
{
    if (lvl >= log_level_trace && lvl <= log_level_error)
    {
        m_threshold = lvl;
    }
}


void log_register_sink(boost::python::object sink)
{
    if (m_sink == nullptr)
    {
        m_sink = new sink_holder;
    }
    m_sink->callable = sink;
}


void log_emit_ll(log_level lvl, const std::string &msg)
{
    if (!log_trigger(lvl))
    {
        return;
    }
    try
    {
        m_sink->callable(lvl, msg);
    }
    catch (const boost::python::error_already_set &)
    {
        // the sink raised: report it on stderr and leave no pending
        // Python error behind for the caller
        PyErr_Print();
    }
}
