#include "ApplicationRegistry.h"

ApplicationRegistry::ApplicationRegistry()
{

}

void ApplicationRegistry::insert(const Application &application)
{
    m_applications.insert(application.name(), application.body());
}

void ApplicationRegistry::insert(const QList<Application> &applications)
{
    for (const Application &application : applications) {
        insert(application);
    }
}

bool ApplicationRegistry::contains(const QString &name) const
{
    return m_applications.contains(name);
}

ApplicationBody ApplicationRegistry::body(const QString &name) const
{
    return m_applications.value(name);
}

QStringList ApplicationRegistry::names() const
{
    return m_applications.keys();
}

int ApplicationRegistry::count() const
{
    return m_applications.count();
}

bool ApplicationRegistry::isEmpty() const
{
    return m_applications.isEmpty();
}

bool ApplicationRegistry::operator==(const ApplicationRegistry &other) const
{
    return m_applications == other.m_applications;
}
