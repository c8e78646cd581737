#include <AWindowError>

const char* toString(EWindowError error) {
    switch (error) {
    case EWindowError::None: return "None";
    case EWindowError::ClassRegistrationFailed: return "ClassRegistrationFailed";
    case EWindowError::WindowCreationFailed: return "WindowCreationFailed";
    case EWindowError::EventRetrievalFailed: return "EventRetrievalFailed";
    case EWindowError::PaintAcquisitionFailed: return "PaintAcquisitionFailed";
    default: return "Unknown";
    }
}
