// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QLoggingCategory>
#include <QtCore/QStringList>
#include <QtCore/QTextStream>
#include <QtCore/QTimer>

#include <cadbridge/CadBridgeSettings.hpp>
#include <cadbridge/CadConnectionManager.hpp>
#include <sketch/SketchJson.hpp>
#include <sketch/SketchTransform.hpp>
#include <utils/EnvironmentQtPolicy.hpp>

Q_LOGGING_CATEGORY(applog, "sketchbridge.app")

using namespace CadBridge;

static constexpr char appNameC[] = "SketchBridge";
static constexpr int defaultMonitorSecondsC = 30;

static QTextStream& out()
{
	static QTextStream stream(stdout);
	return stream;
}

static void printErrorsAndFail(const QString& header, const QStringList& errors)
{
	qCritical().noquote() << header;
	for (const QString& e : errors)
		qCritical().noquote() << "  " << e;
}

static QString formatPoint(const Sketch::Point2D& p)
{
	return QStringLiteral("(%1, %2)").arg(p.x, 0, 'g', 10).arg(p.y, 0, 'g', 10);
}

static QString formatBounds(const Sketch::SketchBounds& b)
{
	if (b.empty)
		return QStringLiteral("<empty>");
	return QStringLiteral("[%1, %2] - [%3, %4]")
		.arg(b.minX, 0, 'g', 10).arg(b.minY, 0, 'g', 10)
		.arg(b.maxX, 0, 'g', 10).arg(b.maxY, 0, 'g', 10);
}

static void printGeometrySummary(const QString& label, const Sketch::SketchDocument& doc)
{
	out() << label << ": " << doc.primitiveCount() << " primitives, "
		  << doc.constraints().size() << " constraints, centroid "
		  << formatPoint(Sketch::sketchCentroid(doc)) << ", bounds "
		  << formatBounds(Sketch::sketchBounds(doc)) << Qt::endl;
}

static bool parseDouble(const QCommandLineParser& parser, const QString& name, double& value)
{
	if (!parser.isSet(name))
		return true;
	bool ok = false;
	value = parser.value(name).toDouble(&ok);
	if (!ok)
		qCritical().noquote() << "Invalid number for --" + name + ":" << parser.value(name);
	return ok;
}

static bool parsePivot(const QString& text, Sketch::TransformRequest& request)
{
	const QString key = text.trimmed().toLower();
	if (key.isEmpty() || key == QStringLiteral("centroid")) {
		request.pivotPolicy = Sketch::PivotPolicy::ComputedCentroid;
		return true;
	}
	if (key == QStringLiteral("origin")) {
		request.pivotPolicy = Sketch::PivotPolicy::Origin;
		return true;
	}

	const QStringList parts = key.split(QLatin1Char(','));
	if (parts.size() != 2)
		return false;

	bool okX = false;
	bool okY = false;
	request.pivot = Sketch::Point2D{parts.at(0).trimmed().toDouble(&okX), parts.at(1).trimmed().toDouble(&okY)};
	request.pivotPolicy = Sketch::PivotPolicy::Explicit;
	return okX && okY;
}

static int runSystems(const CadBridgeSettings& settings)
{
	for (const CadSystem system : allCadSystems()) {
		const CadEndpoint& endpoint = settings.endpoint(system);
		out() << cadSystemDisplayName(system).leftJustified(12) << ' '
			  << cadSystemKey(system).leftJustified(12) << ' '
			  << endpoint.host << ':' << endpoint.port << Qt::endl;
	}
	return 0;
}

static int runTransform(const QCommandLineParser& parser, const QStringList& args)
{
	if (args.size() != 3) {
		qCritical().noquote() << "Usage: sketchbridge transform <in.json> <out.json> [options]";
		return 2;
	}

	Sketch::TransformRequest request;
	if (!parseDouble(parser, QStringLiteral("dx"), request.dx)
		|| !parseDouble(parser, QStringLiteral("dy"), request.dy)
		|| !parseDouble(parser, QStringLiteral("angle"), request.angleDegrees))
		return 2;

	if (!parsePivot(parser.value(QStringLiteral("pivot")), request)) {
		qCritical().noquote() << "Invalid --pivot, expected origin, centroid or x,y:"
							  << parser.value(QStringLiteral("pivot"));
		return 2;
	}
	request.stripConstraints = parser.isSet(QStringLiteral("strip-constraints"));

	Sketch::SketchDocument doc;
	const Utils::Result loaded = Sketch::loadSketchFile(args.at(1), doc);
	if (!loaded) {
		printErrorsAndFail(QStringLiteral("Failed to load %1:").arg(args.at(1)), loaded.errors);
		return 1;
	}

	const Sketch::SketchDocument transformed = Sketch::transformSketch(doc, request);
	printGeometrySummary(QStringLiteral("before"), doc);
	printGeometrySummary(QStringLiteral("after"), transformed);

	const Utils::Result saved = Sketch::saveSketchFile(args.at(2), transformed);
	if (!saved) {
		printErrorsAndFail(QStringLiteral("Failed to save %1:").arg(args.at(2)), saved.errors);
		return 1;
	}

	qCInfo(applog).noquote() << "Wrote" << args.at(2);
	return 0;
}

static int runMonitor(QCoreApplication& app, const QCommandLineParser& parser, const CadBridgeSettings& settings)
{
	int seconds = defaultMonitorSecondsC;
	if (parser.isSet(QStringLiteral("seconds"))) {
		bool ok = false;
		seconds = parser.value(QStringLiteral("seconds")).toInt(&ok);
		if (!ok || seconds <= 0) {
			qCritical().noquote() << "Invalid --seconds:" << parser.value(QStringLiteral("seconds"));
			return 2;
		}
	}

	// The stock binary links no RPC adapters; embedders register factories here.
	CadConnectionManager manager(CadClientFactories{}, settings);

	QObject::connect(&manager, &CadConnectionManager::connectionChanged, &app,
					 [](CadSystem system, bool connected) {
						 qCInfo(applog).noquote() << cadSystemDisplayName(system)
												  << (connected ? "connected" : "unreachable");
					 });
	QObject::connect(&manager, &CadConnectionManager::statusUpdated, &app,
					 [](CadSystem system, const CadStatus& status) {
						 qCInfo(applog).noquote() << cadSystemDisplayName(system) << "-" << statusSummary(status);
					 });

	manager.start();
	QTimer::singleShot(seconds * 1000, &app, &QCoreApplication::quit);
	const int rc = app.exec();
	manager.stop();

	for (const CadSystem system : allCadSystems()) {
		out() << cadSystemDisplayName(system).leftJustified(12) << ' '
			  << (manager.isConnected(system) ? statusSummary(manager.status(system)) : QStringLiteral("unreachable"))
			  << Qt::endl;
	}
	return rc;
}

int main(int argc, char** argv)
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setOrganizationName(QString::fromLatin1(appNameC));
	QCoreApplication::setApplicationName(QStringLiteral("sketchbridge"));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Move 2D sketches between CAD applications."));
	parser.addHelpOption();
	parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("systems | transform | monitor"));
	parser.addOptions({
		{QStringLiteral("workspace"), QStringLiteral("Workspace whose settings override the global ones."), QStringLiteral("dir")},
		{QStringLiteral("dx"), QStringLiteral("Translation along X."), QStringLiteral("value")},
		{QStringLiteral("dy"), QStringLiteral("Translation along Y."), QStringLiteral("value")},
		{QStringLiteral("angle"), QStringLiteral("Rotation in degrees, counter-clockwise."), QStringLiteral("degrees")},
		{QStringLiteral("pivot"), QStringLiteral("Rotation pivot: origin, centroid or x,y."), QStringLiteral("pivot"), QStringLiteral("centroid")},
		{QStringLiteral("strip-constraints"), QStringLiteral("Drop constraints from the transformed sketch.")},
		{QStringLiteral("seconds"), QStringLiteral("How long to monitor backends."), QStringLiteral("n")},
	});
	parser.process(app);

	const QStringList args = parser.positionalArguments();
	if (args.isEmpty()) {
		parser.showHelp(2);
	}

	Utils::Environment env = Utils::makeEnvironment(QString::fromLatin1(appNameC),
													parser.value(QStringLiteral("workspace")));
	CadBridgeSettings settings;
	const Utils::Result settingsResult = loadCadBridgeSettings(env, settings);
	if (!settingsResult) {
		for (const QString& e : settingsResult.errors)
			qCWarning(applog).noquote() << "Ignoring setting:" << e;
	}

	const QString command = args.front().toLower();
	if (command == QStringLiteral("systems"))
		return runSystems(settings);
	if (command == QStringLiteral("transform"))
		return runTransform(parser, args);
	if (command == QStringLiteral("monitor"))
		return runMonitor(app, parser, settings);

	qCritical().noquote() << "Unknown command:" << args.front();
	return 2;
}
