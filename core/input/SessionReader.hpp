#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <QByteArray>
#include <QFile>
#include <QIODevice>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include "core/input/FaceFrame.hpp"
#include "core/input/HandFrame.hpp"
#include "utils/Geometry.hpp"
#include "utils/Logger.hpp"

namespace sl {

// One callback's worth of tracker output.
struct SessionTick {
    std::uint64_t timestamp{0};
    std::vector<HandFrame> hands;
    std::vector<FaceFrame> faces;
};

// Reads recorded tracker output:
//   [{"timestamp": ms,
//     "hands": [{"handedness": "Left", "score": 0.9, "landmarks": [[x,y,z], ...]}],
//     "face": [[x,y,z], ...] | {"mouthLeft": [x,y,z], ...}}, ...]
// A face array is the full mesh; an object names landmark roles directly.
class SessionReader {
public:
    static bool readFile(const std::string& path, std::vector<SessionTick>& ticks) {
        QFile file(QString::fromStdString(path));
        if (!file.open(QIODevice::ReadOnly)) {
            SL_LOG_TAG(LogLevel::Error, "SessionReader", "Cannot open " + path);
            return false;
        }
        const QByteArray data = file.readAll();
        file.close();
        if (!parse(data, ticks)) {
            SL_LOG_TAG(LogLevel::Error, "SessionReader", "Malformed session " + path);
            return false;
        }
        SL_LOG_TAG(LogLevel::Info, "SessionReader",
                   "Read " + std::to_string(ticks.size()) + " ticks from " + path);
        return true;
    }

    static bool parse(const QByteArray& data, std::vector<SessionTick>& ticks) {
        const QJsonDocument doc = QJsonDocument::fromJson(data);
        if (!doc.isArray())
            return false;
        ticks.clear();
        for (const QJsonValue& value : doc.array()) {
            if (!value.isObject())
                continue;
            ticks.push_back(readTick(value.toObject()));
        }
        return true;
    }

    static SessionTick readTick(const QJsonObject& obj) {
        SessionTick tick;
        const double ts = obj.value(QStringLiteral("timestamp")).toDouble();
        tick.timestamp = saturatingCast<std::uint64_t>(ts);

        for (const QJsonValue& hand : obj.value(QStringLiteral("hands")).toArray()) {
            if (!hand.isObject())
                continue;
            const QJsonObject h = hand.toObject();
            const Handedness side =
                handednessFromName(h.value(QStringLiteral("handedness")).toString().toStdString())
                    .value_or(Handedness::Right);
            const float score = static_cast<float>(h.value(QStringLiteral("score")).toDouble(1.0));
            tick.hands.push_back(
                HandFrame::fromLandmarks(readPoints(h.value(QStringLiteral("landmarks")).toArray()), side, score));
        }

        const QJsonValue face = obj.value(QStringLiteral("face"));
        if (face.isArray()) {
            tick.faces.push_back(FaceFrame::fromMesh(readPoints(face.toArray())));
        } else if (face.isObject()) {
            const QJsonObject roles = face.toObject();
            FaceFrame frame;
            for (auto it = roles.begin(); it != roles.end(); ++it) {
                const auto role = faceLandmarkFromName(it.key().toStdString());
                FeaturePoint p;
                if (role && readPoint(it.value(), p))
                    frame.set(*role, p);
            }
            tick.faces.push_back(frame);
        }
        return tick;
    }

private:
    // [x, y] or [x, y, z]; anything shorter is rejected.
    static bool readPoint(const QJsonValue& value, FeaturePoint& out) {
        if (!value.isArray())
            return false;
        const QJsonArray xyz = value.toArray();
        if (xyz.size() < 2)
            return false;
        out.x = static_cast<float>(xyz.at(0).toDouble());
        out.y = static_cast<float>(xyz.at(1).toDouble());
        out.z = xyz.size() > 2 ? static_cast<float>(xyz.at(2).toDouble()) : 0.f;
        return true;
    }

    // Malformed entries stop the list so that later indices keep their roles.
    static std::vector<FeaturePoint> readPoints(const QJsonArray& array) {
        std::vector<FeaturePoint> points;
        points.reserve(static_cast<std::size_t>(array.size()));
        for (const QJsonValue& v : array) {
            FeaturePoint p;
            if (!readPoint(v, p))
                break;
            points.push_back(p);
        }
        return points;
    }
};

} // namespace sl
