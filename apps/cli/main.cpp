#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QFile>
#include <QIODevice>
#include <QJsonDocument>
#include <QString>
#include <QTextStream>

#include <cstdint>
#include <string>
#include <vector>

#include "core/config/EngineConfig.hpp"
#include "core/input/SessionReader.hpp"
#include "core/session/SignSession.hpp"
#include "core/translation/GestureDictionary.hpp"
#include "utils/Logger.hpp"

namespace {

void printSigns(QTextStream& out, const std::vector<sl::SignToken>& signs) {
    for (const auto& sign : signs) {
        out << QString::fromStdString(sign.word) << '\t' << QString::fromStdString(sign.gesture)
            << '\t' << (sign.fingerSpelled ? "spelled" : "word") << '\t'
            << QString::fromStdString(sign.description) << '\n';
    }
    out.flush();
}

int replaySession(QTextStream& out, sl::SignSession& session, const std::vector<sl::SessionTick>& ticks) {
    for (const auto& tick : ticks) {
        if (!tick.faces.empty()) {
            const sl::MoodReading mood = session.onFaceFrames(tick.faces, tick.timestamp);
            SL_LOG(sl::LogLevel::Debug, std::string("mood ") + sl::moodName(mood.mood));
        }
        const sl::HandTickResult result = session.onHandFrames(tick.hands, tick.timestamp);
        for (const auto& event : result.events) {
            if (!event.hasLabel())
                continue;
            out << tick.timestamp << '\t' << sl::handednessName(event.handedness) << '\t'
                << QString::fromStdString(event.primaryLabel().value_or(std::string())) << '\n';
        }
        if (result.update) {
            out << tick.timestamp << "\ttoken\t" << QString::fromStdString(result.update->current.text)
                << "\tsentence\t" << QString::fromStdString(result.update->sentence) << '\n';
        }
    }

    const sl::MoodReading mood = session.mood().current();
    out << "sentence: " << QString::fromStdString(session.translation().currentSentence()) << '\n';
    out << "mood: " << QString::fromUtf8(sl::moodEmoji(mood.mood)) << ' ' << sl::moodName(mood.mood) << " ("
        << mood.confidence << ")\n";
    if (!ticks.empty()) {
        if (auto dominant = session.mood().dominantMood(ticks.back().timestamp))
            out << "dominant mood: " << sl::moodName(dominant->mood) << '\n';
    }
    out << "trend: " << sl::moodTrendName(session.mood().trend()) << '\n';
    out.flush();
    return 0;
}

bool writeExport(const QString& path, const sl::SignSession& session) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    const auto now = static_cast<std::uint64_t>(QDateTime::currentMSecsSinceEpoch());
    file.write(QJsonDocument(session.translation().exportData(now)).toJson(QJsonDocument::Indented));
    file.close();
    return true;
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("signlink"));
    QCommandLineParser parser;
    parser.setApplicationDescription("SignLink gesture and mood translation");
    parser.addHelpOption();

    QCommandLineOption configOpt({"c", "config"}, "Engine config (JSON)", "file",
                                 "config/signlink.json");
    QCommandLineOption dictionaryOpt({"d", "dictionary"}, "Gesture dictionary (JSON)", "file");
    QCommandLineOption sessionOpt({"s", "session"}, "Replay a recorded landmark session", "file");
    QCommandLineOption textOpt({"t", "text"}, "Print the sign sequence for text", "text");
    QCommandLineOption exportOpt({"e", "export"}, "Write the translation record", "file");
    QCommandLineOption logLevelOpt({"l", "log-level"}, "DEBUG, INFO, WARN or ERROR", "level");

    parser.addOption(configOpt);
    parser.addOption(dictionaryOpt);
    parser.addOption(sessionOpt);
    parser.addOption(textOpt);
    parser.addOption(exportOpt);
    parser.addOption(logLevelOpt);

    parser.process(app);

    if (parser.isSet(logLevelOpt))
        sl::setLogLevel(sl::parseLogLevel(parser.value(logLevelOpt).toStdString()));

    SL_LOG(sl::LogLevel::Info, "SignLink starting");

    sl::EngineConfig config;
    config.load(parser.value(configOpt).toStdString());
    const std::string dictionaryPath =
        parser.isSet(dictionaryOpt) ? parser.value(dictionaryOpt).toStdString() : config.dictionaryPath;
    sl::SignSession session(config, sl::GestureDictionary::loadOrBuiltin(dictionaryPath));

    QTextStream out(stdout);
    int status = 0;

    if (parser.isSet(textOpt))
        printSigns(out, session.translation().translateTextToSign(parser.value(textOpt).toStdString()));

    if (parser.isSet(sessionOpt)) {
        std::vector<sl::SessionTick> ticks;
        if (!sl::SessionReader::readFile(parser.value(sessionOpt).toStdString(), ticks))
            return 1;
        status = replaySession(out, session, ticks);
    }

    if (parser.isSet(exportOpt)) {
        if (!writeExport(parser.value(exportOpt), session)) {
            SL_LOG(sl::LogLevel::Error, "Cannot write " + parser.value(exportOpt).toStdString());
            return 1;
        }
        SL_LOG(sl::LogLevel::Info, "Exported translation to " + parser.value(exportOpt).toStdString());
    }

    if (!parser.isSet(textOpt) && !parser.isSet(sessionOpt) && !parser.isSet(exportOpt))
        parser.showHelp(0);

    SL_LOG(sl::LogLevel::Info, "SignLink finished");
    return status;
}
