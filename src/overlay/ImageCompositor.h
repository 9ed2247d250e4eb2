#pragma once

#include <QColor>
#include <QFont>
#include <QImage>
#include <QSize>
#include <QString>
#include "SpeakerLayout.h"

class JobLogger;

// Raster helpers for the still parts of a meeting frame: the background image
// and the name plates drawn under each speaker.
class ImageCompositor {
public:
    ImageCompositor(const SpeakerLayout& style, JobLogger& logger);
    ~ImageCompositor();

    // Owns the application font registration, so it is never shared
    ImageCompositor(const ImageCompositor&) = delete;
    ImageCompositor& operator=(const ImageCompositor&) = delete;

    // Decodes a still image into RGB32. Returns a null image and sets error
    // when the file cannot be decoded.
    static QImage loadImage(const QString& filePath, QString* error = nullptr);

    const QFont& font() const { return m_font; }

    // Registration id of style.fontPath, -1 when no file was loaded
    int applicationFontId() const { return m_appFontId; }
    QSize measureText(const QString& text) const;

    // ARGB32 plate with the text centered, at least minWidth wide and
    // NamePlateMinHeight tall
    QImage renderNamePlate(const QString& text, int minWidth) const;

    // Alpha-blends overlay onto background at (x, y). Returns false and leaves
    // the background untouched if the overlay does not fit entirely.
    static bool overlay(QImage& background, const QImage& overlay, int x, int y,
                        double opacity = 1.0);

private:
    QFont resolveFont(const SpeakerLayout& style);

    SpeakerLayout m_style;
    JobLogger& m_logger;
    QFont m_font;
    int m_appFontId = -1;
};
