// ============================================================================
// InkOperation - Implementation
// ============================================================================
// Part of the SpeedyInk document model
// ============================================================================

#include "InkOperation.h"

#include <QDebug>
#include <QJsonArray>

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

QString operationType(const InkOperation& op)
{
    return std::visit(Overloaded{
        [](const ClearOperation&)        { return QStringLiteral("clear"); },
        [](const CreateStrokeOperation&) { return QStringLiteral("createStroke"); },
        [](const StylusOperation&)       { return QStringLiteral("stylus"); },
        [](const EraseStrokesOperation&) { return QStringLiteral("eraseStrokes"); },
    }, op);
}

QJsonObject operationToJson(const InkOperation& op)
{
    QJsonObject obj;
    obj["type"] = operationType(op);

    std::visit(Overloaded{
        [&obj](const ClearOperation& clear) {
            obj["time"] = static_cast<double>(clear.time);
        },
        [&obj](const CreateStrokeOperation& create) {
            obj["time"] = static_cast<double>(create.time);
            obj["id"] = create.id;
            obj["pen"] = create.pen.toJson();
        },
        [&obj](const StylusOperation& stylus) {
            obj["id"] = stylus.id;
            obj["point"] = stylus.point.toJson();
        },
        [&obj](const EraseStrokesOperation& erase) {
            obj["ids"] = QJsonArray::fromStringList(erase.ids);
        },
    }, op);

    return obj;
}

std::optional<InkOperation> operationFromJson(const QJsonObject& obj)
{
    const QString type = obj["type"].toString();

    if (type == QLatin1String("clear")) {
        ClearOperation clear;
        clear.time = static_cast<qint64>(obj["time"].toDouble(0));
        return InkOperation(clear);
    }

    if (type == QLatin1String("createStroke")) {
        CreateStrokeOperation create;
        create.time = static_cast<qint64>(obj["time"].toDouble(0));
        create.id = obj["id"].toString();
        create.pen = Pen::fromJson(obj["pen"].toObject());
        if (create.id.isEmpty()) {
            qWarning() << "InkOperation: createStroke without id";
            return std::nullopt;
        }
        return InkOperation(create);
    }

    if (type == QLatin1String("stylus")) {
        StylusOperation stylus;
        stylus.id = obj["id"].toString();
        stylus.point = InkPoint::fromJson(obj["point"].toObject());
        if (stylus.id.isEmpty()) {
            qWarning() << "InkOperation: stylus without stroke id";
            return std::nullopt;
        }
        return InkOperation(stylus);
    }

    if (type == QLatin1String("eraseStrokes")) {
        EraseStrokesOperation erase;
        for (const auto& val : obj["ids"].toArray()) {
            erase.ids.append(val.toString());
        }
        return InkOperation(erase);
    }

    qWarning() << "InkOperation: unknown operation type" << type;
    return std::nullopt;
}
