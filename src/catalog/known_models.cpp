#include "catalog/known_models.h"

const QVector<KnownModel>& known_models() {
	// Vendor and crates share ids across levels; nanotech crates differ per level.
	static const QVector<KnownModel> kModels = {
		{"Vendor", {11}},
		{"VendorLogo", {1143}},
		{"Crate", {500}},
		{"AmmoCrate", {511}},
		{"NanotechCrate", {512, 501}},
		{"SwingshotNode", {803}},
		{"SwingshotPull", {758}},
	};
	return kModels;
}

QString friendly_model_name(int model_id) {
	for (const KnownModel& m : known_models()) {
		if (m.ids.contains(model_id)) {
			return m.name;
		}
	}
	return QString("Moby_%1").arg(model_id);
}

QString sanitize_file_name(QString name) {
	static const QString kInvalid = QStringLiteral("<>:\"/\\|?*");
	for (qsizetype i = 0; i < name.size(); ++i) {
		const QChar c = name.at(i);
		if (c.unicode() < 0x20 || kInvalid.contains(c)) {
			name[i] = '_';
		}
	}
	name = name.trimmed();
	if (name.isEmpty() || name == "." || name == "..") {
		name = "_";
	}
	return name;
}
