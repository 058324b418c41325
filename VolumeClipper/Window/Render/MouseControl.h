#pragma once
#include <vtkInteractorStyleTrackballCamera.h>
#include <functional>

// Навигация без левой кнопки: левая и правая заняты ножницами.
//  MMB - вращение, Shift+MMB - сдвиг, Ctrl+MMB - наезд,
//  Ctrl+LMB - вращение, колесо - масштаб.
class InteractorStyleClipNavigation : public vtkInteractorStyleTrackballCamera
{
public:
    static InteractorStyleClipNavigation* New();
    vtkTypeMacro(InteractorStyleClipNavigation, vtkInteractorStyleTrackballCamera);

    // Вызывается после каждого завершённого движения камеры
    void setOnCameraMoved(std::function<void()> cb) { mOnCameraMoved = std::move(cb); }

    void OnMiddleButtonDown() override;
    void OnMiddleButtonUp() override;
    void OnLeftButtonDown() override;
    void OnLeftButtonUp() override;
    void OnMouseWheelForward() override;
    void OnMouseWheelBackward() override;
    void OnRightButtonDown() override {}
    void OnRightButtonUp() override {}

private:
    std::function<void()> mOnCameraMoved;

    void endInteraction();
    void notifyMoved();
};
