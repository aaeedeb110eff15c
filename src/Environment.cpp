#include "Environment.h"

Environment::Environment(const QProcessEnvironment &env)
    : m_env(env)
{

}

QString Environment::home(bool &ok) const
{
    return variable("HOME", ok);
}

QString Environment::terminal(bool &ok) const
{
    return variable("TERM", ok);
}

QString Environment::variable(const QString &name, bool &ok) const
{
    ok = m_env.contains(name);
    if (!ok) {
        return QString();
    }
    return m_env.value(name);
}
