#include "MouseControl.h"
#include <vtkObjectFactory.h>
#include <vtkRenderWindowInteractor.h>

vtkStandardNewMacro(InteractorStyleClipNavigation);

void InteractorStyleClipNavigation::OnMiddleButtonDown()
{
    if (!this->Interactor) return;

    this->FindPokedRenderer(this->Interactor->GetEventPosition()[0],
        this->Interactor->GetEventPosition()[1]);
    if (!this->CurrentRenderer) return;

    if (this->Interactor->GetControlKey())
        this->StartDolly();
    else if (this->Interactor->GetShiftKey())
        this->StartPan();
    else
        this->StartRotate();
}

void InteractorStyleClipNavigation::OnMiddleButtonUp()
{
    endInteraction();
}

void InteractorStyleClipNavigation::OnLeftButtonDown()
{
    if (!this->Interactor || !this->Interactor->GetControlKey()) return;

    this->FindPokedRenderer(this->Interactor->GetEventPosition()[0],
        this->Interactor->GetEventPosition()[1]);
    if (!this->CurrentRenderer) return;

    this->StartRotate();
}

void InteractorStyleClipNavigation::OnLeftButtonUp()
{
    endInteraction();
}

void InteractorStyleClipNavigation::OnMouseWheelForward()
{
    vtkInteractorStyleTrackballCamera::OnMouseWheelForward();
    notifyMoved();
}

void InteractorStyleClipNavigation::OnMouseWheelBackward()
{
    vtkInteractorStyleTrackballCamera::OnMouseWheelBackward();
    notifyMoved();
}

void InteractorStyleClipNavigation::endInteraction()
{
    const int state = this->State;
    switch (state)
    {
    case VTKIS_DOLLY:
        this->EndDolly();
        break;
    case VTKIS_ROTATE:
        this->EndRotate();
        break;
    case VTKIS_PAN:
        this->EndPan();
        break;
    default:
        return;
    }
    if (this->Interactor) this->Interactor->Render();
    notifyMoved();
}

void InteractorStyleClipNavigation::notifyMoved()
{
    if (mOnCameraMoved) mOnCameraMoved();
}
