#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include <QByteArray>
#include <QFile>
#include <QIODevice>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include "core/mood/MoodClassifier.hpp"
#include "core/mood/MoodHistory.hpp"
#include "core/recognition/DynamicGestureDetector.hpp"
#include "core/recognition/GestureHistory.hpp"
#include "core/recognition/StaticGestureClassifier.hpp"
#include "core/translation/TranslationEngine.hpp"
#include "utils/Geometry.hpp"
#include "utils/Logger.hpp"

namespace sl {

struct EngineConfig {
    std::string dictionaryPath{"config/asl-gestures.json"};
    std::uint64_t translationTimeoutMs{TranslationEngine::kDefaultTimeoutMs};
    std::size_t gestureHistoryCapacity{GestureHistory::kDefaultCapacity};
    std::size_t moodHistoryCapacity{MoodHistory::kDefaultCapacity};
    std::uint64_t heldDurationMs{1000};
    HandShapeThresholds handShape;
    DynamicThresholds motion;
    MoodThresholds mood;

    // A missing file leaves the defaults in place and still succeeds.
    // Malformed JSON keeps the defaults and returns false.
    bool load(const std::string& path) {
        QFile file(QString::fromStdString(path));
        if (!file.exists()) {
            SL_LOG_TAG(LogLevel::Info, "EngineConfig", "No config at " + path + ", using defaults");
            return true;
        }
        if (!file.open(QIODevice::ReadOnly)) {
            SL_LOG_TAG(LogLevel::Warn, "EngineConfig", "Cannot open " + path);
            return false;
        }
        const QByteArray data = file.readAll();
        file.close();

        const QJsonDocument doc = QJsonDocument::fromJson(data);
        if (!doc.isObject()) {
            SL_LOG_TAG(LogLevel::Warn, "EngineConfig", "Malformed config " + path + ", using defaults");
            return false;
        }
        *this = fromJson(doc.object());
        SL_LOG_TAG(LogLevel::Info, "EngineConfig", "Loaded config from " + path);
        return true;
    }

    bool save(const std::string& path) const {
        QFile file(QString::fromStdString(path));
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
            return false;
        file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
        file.close();
        return true;
    }

    // Keys absent from `obj` keep their default values.
    static EngineConfig fromJson(const QJsonObject& obj) {
        EngineConfig cfg;
        cfg.dictionaryPath =
            obj.value(QStringLiteral("dictionaryPath")).toString(QString::fromStdString(cfg.dictionaryPath)).toStdString();
        readUInt(obj, "translationTimeoutMs", cfg.translationTimeoutMs);
        readSize(obj, "gestureHistoryCapacity", cfg.gestureHistoryCapacity);
        readSize(obj, "moodHistoryCapacity", cfg.moodHistoryCapacity);
        readUInt(obj, "heldDurationMs", cfg.heldDurationMs);

        const QJsonObject shape = obj.value(QStringLiteral("handShape")).toObject();
        readFloat(shape, "fingerExtensionRatio", cfg.handShape.fingerExtensionRatio);
        readFloat(shape, "thumbExtensionRatio", cfg.handShape.thumbExtensionRatio);
        readFloat(shape, "thumbBesideDistance", cfg.handShape.thumbBesideDistance);
        readFloat(shape, "thumbVerticalOffset", cfg.handShape.thumbVerticalOffset);
        readFloat(shape, "touchDistance", cfg.handShape.touchDistance);
        readFloat(shape, "spreadDistance", cfg.handShape.spreadDistance);
        readFloat(shape, "confidence", cfg.handShape.confidence);

        const QJsonObject motion = obj.value(QStringLiteral("motion")).toObject();
        readSize(motion, "window", cfg.motion.window);
        readFloat(motion, "swipeDistance", cfg.motion.swipeDistance);
        readFloat(motion, "waveDeadband", cfg.motion.waveDeadband);
        if (motion.contains(QStringLiteral("waveDirectionChanges")))
            cfg.motion.waveDirectionChanges = motion.value(QStringLiteral("waveDirectionChanges")).toInt();

        const QJsonObject mood = obj.value(QStringLiteral("mood")).toObject();
        readFloat(mood, "happyCurvature", cfg.mood.happyCurvature);
        readFloat(mood, "happyMouthRatio", cfg.mood.happyMouthRatio);
        readFloat(mood, "sadCurvature", cfg.mood.sadCurvature);
        readFloat(mood, "sadEyebrow", cfg.mood.sadEyebrow);
        readFloat(mood, "surprisedEyeOpenness", cfg.mood.surprisedEyeOpenness);
        readFloat(mood, "surprisedMouthRatio", cfg.mood.surprisedMouthRatio);
        readFloat(mood, "angryEyebrow", cfg.mood.angryEyebrow);
        readFloat(mood, "angryMouthWidth", cfg.mood.angryMouthWidth);
        readFloat(mood, "fearfulEyeOpenness", cfg.mood.fearfulEyeOpenness);
        readFloat(mood, "fearfulEyebrow", cfg.mood.fearfulEyebrow);
        readFloat(mood, "fearfulMaxConfidence", cfg.mood.fearfulMaxConfidence);
        readFloat(mood, "disgustedCurvature", cfg.mood.disgustedCurvature);
        readFloat(mood, "disgustedMouthWidth", cfg.mood.disgustedMouthWidth);
        readFloat(mood, "disgustedMaxConfidence", cfg.mood.disgustedMaxConfidence);
        return cfg;
    }

    QJsonObject toJson() const {
        QJsonObject obj;
        obj.insert(QStringLiteral("dictionaryPath"), QString::fromStdString(dictionaryPath));
        obj.insert(QStringLiteral("translationTimeoutMs"), static_cast<double>(translationTimeoutMs));
        obj.insert(QStringLiteral("gestureHistoryCapacity"), static_cast<double>(gestureHistoryCapacity));
        obj.insert(QStringLiteral("moodHistoryCapacity"), static_cast<double>(moodHistoryCapacity));
        obj.insert(QStringLiteral("heldDurationMs"), static_cast<double>(heldDurationMs));

        QJsonObject shape;
        shape.insert(QStringLiteral("fingerExtensionRatio"), handShape.fingerExtensionRatio);
        shape.insert(QStringLiteral("thumbExtensionRatio"), handShape.thumbExtensionRatio);
        shape.insert(QStringLiteral("thumbBesideDistance"), handShape.thumbBesideDistance);
        shape.insert(QStringLiteral("thumbVerticalOffset"), handShape.thumbVerticalOffset);
        shape.insert(QStringLiteral("touchDistance"), handShape.touchDistance);
        shape.insert(QStringLiteral("spreadDistance"), handShape.spreadDistance);
        shape.insert(QStringLiteral("confidence"), handShape.confidence);
        obj.insert(QStringLiteral("handShape"), shape);

        QJsonObject m;
        m.insert(QStringLiteral("window"), static_cast<double>(motion.window));
        m.insert(QStringLiteral("swipeDistance"), motion.swipeDistance);
        m.insert(QStringLiteral("waveDeadband"), motion.waveDeadband);
        m.insert(QStringLiteral("waveDirectionChanges"), motion.waveDirectionChanges);
        obj.insert(QStringLiteral("motion"), m);

        QJsonObject md;
        md.insert(QStringLiteral("happyCurvature"), mood.happyCurvature);
        md.insert(QStringLiteral("happyMouthRatio"), mood.happyMouthRatio);
        md.insert(QStringLiteral("sadCurvature"), mood.sadCurvature);
        md.insert(QStringLiteral("sadEyebrow"), mood.sadEyebrow);
        md.insert(QStringLiteral("surprisedEyeOpenness"), mood.surprisedEyeOpenness);
        md.insert(QStringLiteral("surprisedMouthRatio"), mood.surprisedMouthRatio);
        md.insert(QStringLiteral("angryEyebrow"), mood.angryEyebrow);
        md.insert(QStringLiteral("angryMouthWidth"), mood.angryMouthWidth);
        md.insert(QStringLiteral("fearfulEyeOpenness"), mood.fearfulEyeOpenness);
        md.insert(QStringLiteral("fearfulEyebrow"), mood.fearfulEyebrow);
        md.insert(QStringLiteral("fearfulMaxConfidence"), mood.fearfulMaxConfidence);
        md.insert(QStringLiteral("disgustedCurvature"), mood.disgustedCurvature);
        md.insert(QStringLiteral("disgustedMouthWidth"), mood.disgustedMouthWidth);
        md.insert(QStringLiteral("disgustedMaxConfidence"), mood.disgustedMaxConfidence);
        obj.insert(QStringLiteral("mood"), md);
        return obj;
    }

private:
    static void readFloat(const QJsonObject& obj, const char* key, float& out) {
        const QJsonValue v = obj.value(QLatin1String(key));
        if (v.isDouble())
            out = static_cast<float>(v.toDouble());
    }

    static void readUInt(const QJsonObject& obj, const char* key, std::uint64_t& out) {
        const QJsonValue v = obj.value(QLatin1String(key));
        if (v.isDouble() && v.toDouble() >= 0.0)
            out = saturatingCast<std::uint64_t>(v.toDouble());
    }

    static void readSize(const QJsonObject& obj, const char* key, std::size_t& out) {
        const QJsonValue v = obj.value(QLatin1String(key));
        if (v.isDouble() && v.toDouble() >= 1.0)
            out = saturatingCast<std::size_t>(v.toDouble());
    }
};

} // namespace sl
