#include <QSettings>

#include "AvailableModelsModel.h"
#include "ModelMgr.h"

#include "logging.h"
using namespace std;


AvailableModelsModel::AvailableModelsModel(QString propertiesTag, QObject *parent)
    : QAbstractListModel(parent), properties_tag_(std::move(propertiesTag))
{
    if (!properties_tag_.isEmpty()) {
        selected_model_id_ = QSettings{}.value(properties_tag_, "").toString().toStdString();
    }
}

void AvailableModelsModel::setModels(model_list_t models, const ModelInfo &defaultModel)
{
    beginResetModel();
    models_.clear();
    models_.reserve(models.size());
    for (const auto& m : models) {
        models_.push_back({&m, ModelMgr::instance().isDownloaded(m)});
    }
    endResetModel();

    // Fall back to the default if nothing valid is stored in the settings
    if (selected() < 0) {
        LOG_DEBUG_N << "Selecting default model " << defaultModel;
        selected_model_id_ = defaultModel.id;
        emit selectedChanged();
    }

    if (!initialized_) {
        connect(&ModelMgr::instance(), &ModelMgr::modelDownloaded,
                this, &AvailableModelsModel::onModelDownloaded);
        initialized_ = true;
    }
}

int AvailableModelsModel::selected() const
{
    if (selected_model_id_.empty()) {
        return -1;
    }

    for (size_t i = 0; i < models_.size(); ++i) {
        if (models_[i].info->id == selected_model_id_) {
            return static_cast<int>(i);
        }
    }

    return -1;
}

void AvailableModelsModel::setSelected(int index)
{
    if (index < 0 || static_cast<size_t>(index) >= models_.size()) {
        LOG_WARN_N << "Ignoring invalid model index " << index;
        return;
    }

    if (selected() != index) {
        selected_model_id_ = models_[static_cast<size_t>(index)].info->id;
        LOG_DEBUG_N << "Selected model " << *models_[static_cast<size_t>(index)].info;
        if (!properties_tag_.isEmpty()) {
            QSettings{}.setValue(properties_tag_, QString::fromStdString(selected_model_id_));
        }
        emit selectedChanged();
    }
}

const ModelInfo *AvailableModelsModel::selectedModel() const
{
    if (const int index = selected(); index >= 0) {
        return models_[static_cast<size_t>(index)].info;
    }
    return nullptr;
}

QString AvailableModelsModel::selectedModelName() const
{
    if (const auto *mi = selectedModel()) {
        return QString::fromUtf8(mi->name);
    }
    return {};
}

int AvailableModelsModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(models_.size());
}

QVariant AvailableModelsModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || static_cast<size_t>(index.row()) >= models_.size()) {
        return {};
    }

    const ModelEntry& entry = models_[static_cast<size_t>(index.row())];

    switch (role) {
    case Qt::DisplayRole:
    case static_cast<int>(Roles::Name):
        return QString::fromUtf8(entry.info->name);
    case static_cast<int>(Roles::Id):
        return QString::fromUtf8(entry.info->id);
    case static_cast<int>(Roles::SizeMB):
        return static_cast<qulonglong>(entry.info->size_mb);
    case static_cast<int>(Roles::Downloaded):
        return entry.downloaded;
    default:
        return {};
    }
}

QHash<int, QByteArray> AvailableModelsModel::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[static_cast<int>(Roles::Name)] = "name";
    roles[static_cast<int>(Roles::Id)] = "id";
    roles[static_cast<int>(Roles::SizeMB)] = "sizeMB";
    roles[static_cast<int>(Roles::Downloaded)] = "downloaded";
    return roles;
}

void AvailableModelsModel::onModelDownloaded(const QString &id)
{
    const auto model_id = id.toStdString();
    for (size_t row = 0; row < models_.size(); ++row) {
        if (models_[row].info->id == model_id) {
            models_[row].downloaded = true;
            const auto idx = index(static_cast<int>(row), 0);
            LOG_TRACE_N << "Model downloaded: updating row " << row;
            emit dataChanged(idx, idx, {static_cast<int>(Roles::Downloaded)});
            break;
        }
    }
}
