#pragma once

#include <string>
#include <vector>

#include <QAbstractListModel>
#include <QObject>

#include "ModelInfo.h"

/*! The model sizes the user can pick from.
 *
 * The selection is stored in the settings as the model id, under `propertiesTag`.
 */
class AvailableModelsModel : public QAbstractListModel
{
    Q_OBJECT

    Q_PROPERTY(int selected READ selected WRITE setSelected NOTIFY selectedChanged)
    Q_PROPERTY(QString selectedName READ selectedModelName NOTIFY selectedChanged)
public:
    enum class Roles {
        Name = Qt::UserRole + 1,
        Id,
        SizeMB,
        Downloaded
    };

    struct ModelEntry {
        const ModelInfo *info{};
        bool downloaded{false};
    };

    AvailableModelsModel(QString propertiesTag, QObject *parent = nullptr);

    Q_INVOKABLE void setSelected(int index);

    void setModels(model_list_t models, const ModelInfo& defaultModel);
    int selected() const;
    const ModelInfo* selectedModel() const;
    QString selectedModelName() const;

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

signals:
    void selectedChanged();

private:
    void onModelDownloaded(const QString& id);

    std::vector<ModelEntry> models_;
    std::string selected_model_id_;
    QString properties_tag_;
    bool initialized_{false};
};
