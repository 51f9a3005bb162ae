#include "hue_state.h"

#include <QJsonArray>
#include <QLoggingCategory>
#include <QMutexLocker>
#include <QThread>

#include "hue_bridge.h"

Q_LOGGING_CATEGORY(stateLog, "huelink.state");

namespace huelink {

namespace {

const QString kTransitionTime = QStringLiteral("transitiontime");

} // namespace

StateTarget::StateTarget(Bridge &bridge, int id)
    : m_bridge(bridge)
    , m_id(id)
{
}

bool StateTarget::setOn(bool on, Error *error)
{
    return stateChange(QStringLiteral("on"), on, error);
}

bool StateTarget::setBrightness(int brightness, Error *error)
{
    if (!validateBrightness(brightness, error))
        return false;
    return stateChange(QStringLiteral("bri"), brightness, error);
}

bool StateTarget::setHue(int hue, Error *error)
{
    if (!validateHue(hue, error))
        return false;
    return stateChange(QStringLiteral("hue"), hue, error);
}

bool StateTarget::setSaturation(int saturation, Error *error)
{
    if (!validateSaturation(saturation, error))
        return false;
    return stateChange(QStringLiteral("sat"), saturation, error);
}

bool StateTarget::setCieXY(double x, double y, Error *error)
{
    if (!validateCieXY(x, y, error))
        return false;
    return stateChange(QStringLiteral("xy"), QJsonArray{x, y}, error);
}

bool StateTarget::setColorTemperature(int colorTemperature, Error *error)
{
    if (!validateColorTemperature(colorTemperature, error))
        return false;
    return stateChange(QStringLiteral("ct"), colorTemperature, error);
}

bool StateTarget::setEffect(Effect effect, Error *error)
{
    return stateChange(QStringLiteral("effect"), effectName(effect), error);
}

bool StateTarget::setAlert(Alert alert, Error *error)
{
    return stateChange(QStringLiteral("alert"), alertName(alert), error);
}

bool StateTarget::hasOpenTransaction() const
{
    QMutexLocker locker(&m_pendingMutex);
    return m_pending.count(QThread::currentThreadId()) > 0;
}

QJsonObject StateTarget::takePending(Qt::HANDLE context)
{
    QMutexLocker locker(&m_pendingMutex);
    auto it = m_pending.find(context);
    if (it == m_pending.end())
        return QJsonObject();
    QJsonObject payload = it->second;
    m_pending.erase(it);
    return payload;
}

bool StateTarget::stateChange(const QString &key, const QJsonValue &value, Error *error)
{
    {
        QMutexLocker locker(&m_pendingMutex);
        auto it = m_pending.find(QThread::currentThreadId());
        if (it != m_pending.end()) {
            it->second.insert(key, value);
            return true;
        }
    }

    QJsonObject body;
    if (m_transitionTime)
        body.insert(kTransitionTime, *m_transitionTime);
    body.insert(key, value);
    return commit(body, error);
}

bool StateTarget::commit(const QJsonObject &payload, Error *error)
{
    if (!m_bridge.checkedSuccessRequest(Method::Put, statePath(), payload, nullptr, error))
        return false;

    QJsonObject fields = payload;
    fields.remove(kTransitionTime);
    applyConfirmed(fields);
    return true;
}

bool StateTarget::stateChangeTransaction(std::optional<int> transitionTime,
                                         const Changes &changes,
                                         Error *error)
{
    const Qt::HANDLE context = QThread::currentThreadId();
    {
        QMutexLocker locker(&m_pendingMutex);
        if (m_pending.count(context) > 0) {
            return fail(error, Error::state(QStringLiteral("Have an open state change transaction on %1 already")
                                                .arg(statePath())));
        }
        QJsonObject seed;
        if (transitionTime)
            seed.insert(kTransitionTime, *transitionTime);
        m_pending.emplace(context, seed);
    }
    qCDebug(stateLog) << "Transaction opened on" << statePath();

    Error bodyError;
    bool bodyOk = true;
    try {
        if (changes)
            bodyOk = changes(&bodyError);
    } catch (...) {
        const QJsonObject dropped = takePending(context);
        qCDebug(stateLog) << "Transaction body on" << statePath() << "threw, discarding" << dropped.keys();
        Error resyncError;
        if (!resync(&resyncError)) {
            qCWarning(stateLog) << "Resync of" << statePath() << "after failed transaction failed:" << resyncError.toString();
            fail(error, resyncError);
        }
        throw;
    }
    if (!bodyOk && bodyError.isOk())
        bodyError = Error::state(QStringLiteral("State change transaction aborted"));

    QJsonObject payload = takePending(context);

    if (!bodyOk) {
        qCDebug(stateLog) << "Transaction body on" << statePath() << "failed, discarding" << payload.keys();
        payload = QJsonObject();
    }

    Error commitError;
    bool commitOk = true;
    if (!payload.isEmpty()) {
        commitOk = commit(payload, &commitError);
        if (commitOk)
            qCDebug(stateLog) << "Transaction committed on" << statePath() << payload.keys();
        else
            qCWarning(stateLog) << "Transaction commit on" << statePath() << "failed:" << commitError.toString();
    }

    if (bodyOk && commitOk)
        return true;

    Error resyncError;
    if (!resync(&resyncError)) {
        qCWarning(stateLog) << "Resync of" << statePath() << "after failed transaction failed:" << resyncError.toString();
        return fail(error, resyncError);
    }
    return fail(error, bodyOk ? commitError : bodyError);
}

} // namespace huelink
