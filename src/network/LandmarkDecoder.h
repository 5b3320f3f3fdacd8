#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <optional>

#include "../common/Types.h"

/**
 * Decodes one line of the tracker protocol:
 *
 *   {"timestamp": 12.34,
 *    "hands": [{"handedness": "Right",
 *               "landmarks": [[x, y, z], ... 21 entries]}]}
 *
 * Landmarks may also be objects {"x": .., "y": .., "z": ..}.
 * Only the first hand is used.
 */

namespace LandmarkDecoder
{
    struct Frame
    {
        bool ok = false;                 // false: line rejected, see error
        std::optional<HandSnapshot> hand; // empty: no hand in view
        QString error;
    };

    Frame decodeLine(const QByteArray &line);

    std::optional<HandSnapshot> decodeHand(const QJsonObject &obj,
                                           double timestamp,
                                           QString *error = nullptr);
}
