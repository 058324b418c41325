#pragma once
#ifndef MAINWINDOW_h
#define MAINWINDOW_h

#include <QMainWindow>
#include "Services/AppConfig.h"

class QLabel;
class RenderView;

class MainWindow final : public QMainWindow
{
    Q_OBJECT
public:
    explicit MainWindow(const AppConfig& config,
        QWidget* parent = nullptr,
        const QString& path = QString());

    // Читает серию из mDicomPath и отдаёт её в RenderView
    void onOpenStudy();

private slots:
    void onOpenFolder();

private:
    void buildUi();
    void wireSignals();
    void StartLoading();
    void StopLoading();
    void showInfo(const QString& text);
    void showWarning(const QString& text);

private:
    QString      mDicomPath;
    AppConfig    mConfig;

    RenderView* mRenderView{ nullptr };
    QLabel* mStatusText{ nullptr };
    bool mLoading = false;
};

#endif // MAINWINDOW_h
