#include "lb/io/params_json.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>

#include <stdexcept>

namespace {

void report(std::vector<std::string>* sink, const std::string& msg) {
  qWarning().noquote() << "[io]" << QString::fromStdString(msg);
  if (sink) sink->push_back(msg);
}

// Première valeur d'un tableau de nombres ; nullopt (+ erreur) si invalide
std::optional<double> first_value(const QJsonObject& o, const char* key,
                                  std::vector<std::string>* errors,
                                  std::vector<std::string>* warnings) {
  const QJsonValue v = o.value(QLatin1String(key));
  if (!v.isArray()) {
    report(errors, std::string(key) + " must be an array of numbers");
    return std::nullopt;
  }
  const QJsonArray a = v.toArray();
  if (a.isEmpty()) {
    report(errors, std::string(key) + " is empty, please add some values under the '" + key + "' key");
    return std::nullopt;
  }
  if (!a.first().isDouble()) {
    report(errors, std::string(key) + ": first value is not a number");
    return std::nullopt;
  }
  if (a.size() > 1) {
    report(warnings, std::string(key) + ": only the first value is used ("
                     + std::to_string(a.size()) + " given)");
  }
  return a.first().toDouble();
}

} // namespace

namespace lb::io {

std::optional<config::LoanParameters>
parse_params_json(const std::string& json_text,
                  std::vector<std::string>* errors,
                  std::vector<std::string>* warnings)
{
  QJsonParseError perr;
  const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(json_text), &perr);
  if (perr.error != QJsonParseError::NoError) {
    report(errors, "An error occured during input file decoding: "
                   + perr.errorString().toStdString()
                   + " (offset " + std::to_string(perr.offset) + ")");
    return std::nullopt;
  }
  if (!doc.isObject()) {
    report(errors, "Input root must be a JSON object");
    return std::nullopt;
  }
  const QJsonObject root = doc.object();

  // 1) présence des clés obligatoires
  for (const char* key : {kKeyCreditAmount, kKeyCreditRate, kKeyExpectedInflation}) {
    if (!root.contains(QLatin1String(key))) {
      report(errors, std::string("There's no ") + key
                     + " in the input file, please set a value under the '" + key + "' key");
      return std::nullopt;
    }
  }

  // 2) types / valeurs
  const QJsonValue amount = root.value(QLatin1String(kKeyCreditAmount));
  if (!amount.isDouble()) {
    report(errors, std::string(kKeyCreditAmount) + " must be a number");
    return std::nullopt;
  }
  const auto rate = first_value(root, kKeyCreditRate, errors, warnings);
  const auto inflation = first_value(root, kKeyExpectedInflation, errors, warnings);
  if (!rate || !inflation) return std::nullopt;

  std::optional<double> acceptable, invest_rate;
  if (root.contains(QLatin1String(kKeyAcceptablePayment))) {
    acceptable = first_value(root, kKeyAcceptablePayment, errors, warnings);
    if (!acceptable) return std::nullopt;
  }
  if (root.contains(QLatin1String(kKeyInvestmentRate))) {
    invest_rate = first_value(root, kKeyInvestmentRate, errors, warnings);
    if (!invest_rate) return std::nullopt;
  }
  if (acceptable.has_value() != invest_rate.has_value()) {
    report(warnings, std::string(kKeyAcceptablePayment) + " and " + kKeyInvestmentRate
                     + " must both be set to enable overpayment/investment modes");
  }

  // 3) domaines (std::invalid_argument côté config)
  try {
    return config::LoanParameters(amount.toDouble(), *rate, *inflation, acceptable, invest_rate);
  } catch (const std::invalid_argument& e) {
    report(errors, e.what());
    return std::nullopt;
  }
}

std::optional<config::LoanParameters>
read_params_json(const std::string& path,
                 std::vector<std::string>* errors,
                 std::vector<std::string>* warnings)
{
  const QString clean = QDir::cleanPath(QString::fromStdString(path));
  if (clean.contains(QLatin1String(".."))) {
    report(errors, "Path traversal detected: " + path);
    return std::nullopt;
  }

  QFile f(clean);
  if (!f.open(QIODevice::ReadOnly)) {
    report(errors, "Cannot open input file: " + path);
    return std::nullopt;
  }
  const QByteArray bytes = f.readAll();
  qDebug().noquote() << "[io] read" << bytes.size() << "bytes from" << clean;
  return parse_params_json(bytes.toStdString(), errors, warnings);
}

bool write_sample_params_json(const std::string& path, std::string* error) {
  const QJsonObject sample{
    {QLatin1String(kKeyCreditAmount),      600000},
    {QLatin1String(kKeyCreditRate),        QJsonArray{8.0}},
    {QLatin1String(kKeyExpectedInflation), QJsonArray{3.0}},
    {QLatin1String(kKeyAcceptablePayment), QJsonArray{6000}},
    {QLatin1String(kKeyInvestmentRate),    QJsonArray{5.0}},
  };

  QFile f(QString::fromStdString(path));
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    if (error) *error = "Failed to write sample input file: " + path;
    qWarning().noquote() << "[io] cannot write" << QString::fromStdString(path);
    return false;
  }
  const QByteArray bytes = QJsonDocument(sample).toJson(QJsonDocument::Indented);
  if (f.write(bytes) != bytes.size()) {
    if (error) *error = "Failed to write sample input file: " + path;
    return false;
  }
  return true;
}

} // namespace lb::io
