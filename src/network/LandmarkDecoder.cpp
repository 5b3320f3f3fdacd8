#include "LandmarkDecoder.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include <cmath>

#include "../common/Constants.h"

namespace
{
    bool inRange(double v)
    {
        return std::isfinite(v) && std::abs(v) <= LANDMARK_COORD_LIMIT;
    }

    bool decodeLandmark(const QJsonValue &val, Landmark &out)
    {
        if (val.isArray())
        {
            const QJsonArray arr = val.toArray();
            if (arr.size() < 2 || arr.size() > 3)
                return false;
            out.x = arr[0].toDouble(NAN);
            out.y = arr[1].toDouble(NAN);
            out.z = arr.size() == 3 ? arr[2].toDouble(NAN) : 0.0;
        }
        else if (val.isObject())
        {
            const QJsonObject obj = val.toObject();
            out.x = obj["x"].toDouble(NAN);
            out.y = obj["y"].toDouble(NAN);
            // 2D trackers omit z
            out.z = obj["z"].toDouble(0.0);
        }
        else
        {
            return false;
        }

        return inRange(out.x) && inRange(out.y) && inRange(out.z);
    }

    void setError(QString *error, const QString &msg)
    {
        if (error)
            *error = msg;
    }
}

namespace LandmarkDecoder
{

std::optional<HandSnapshot> decodeHand(const QJsonObject &obj, double timestamp,
                                       QString *error)
{
    const QJsonArray arr = obj["landmarks"].toArray();
    if (arr.size() != HAND_LANDMARK_COUNT)
    {
        setError(error, QStringLiteral("expected %1 landmarks, got %2")
                            .arg(HAND_LANDMARK_COUNT)
                            .arg(arr.size()));
        return std::nullopt;
    }

    HandSnapshot hand;
    hand.timestamp = timestamp;
    hand.handedness = obj["handedness"].toString(QStringLiteral("Right"));

    for (int i = 0; i < HAND_LANDMARK_COUNT; ++i)
    {
        if (!decodeLandmark(arr[i], hand.landmarks[i]))
        {
            setError(error, QStringLiteral("landmark %1 is malformed").arg(i));
            return std::nullopt;
        }
    }

    return hand;
}

Frame decodeLine(const QByteArray &line)
{
    Frame frame;

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &err);
    if (err.error != QJsonParseError::NoError)
    {
        frame.error = err.errorString();
        return frame;
    }

    if (!doc.isObject())
    {
        frame.error = QStringLiteral("message is not a JSON object");
        return frame;
    }

    const QJsonObject root = doc.object();
    const double timestamp = root["timestamp"].toDouble(0.0);
    const QJsonArray hands = root["hands"].toArray();

    frame.ok = true;
    if (hands.isEmpty())
        return frame;

    QString handError;
    frame.hand = decodeHand(hands.first().toObject(), timestamp, &handError);
    if (!frame.hand)
    {
        frame.ok = false;
        frame.error = handError;
    }
    return frame;
}

}
