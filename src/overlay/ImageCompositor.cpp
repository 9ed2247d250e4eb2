#include "ImageCompositor.h"
#include "AppConstants.h"
#include "JobLogger.h"
#include <QFileInfo>
#include <QFontDatabase>
#include <QFontMetrics>
#include <QImageReader>
#include <QPainter>
#include <QtGlobal>
#include <algorithm>

namespace {

const char* const FallbackFamilies[] = { "DejaVu Sans", "Liberation Sans", "Arial" };

} // namespace

ImageCompositor::ImageCompositor(const SpeakerLayout& style, JobLogger& logger)
    : m_style(style)
    , m_logger(logger)
{
    m_font = resolveFont(style);
}

ImageCompositor::~ImageCompositor() {
    // Registrations are process-wide, one per compositor would pile up across jobs
    if (m_appFontId >= 0)
        QFontDatabase::removeApplicationFont(m_appFontId);
}

QFont ImageCompositor::resolveFont(const SpeakerLayout& style) {
    QString family;

    if (!style.fontPath.isEmpty()) {
        m_appFontId = QFontDatabase::addApplicationFont(style.fontPath);
        QStringList loaded = m_appFontId >= 0
            ? QFontDatabase::applicationFontFamilies(m_appFontId) : QStringList();
        if (!loaded.isEmpty())
            family = loaded.first();
        else
            m_logger.warning(QString("Cannot load font file %1, falling back")
                                 .arg(QFileInfo(style.fontPath).fileName()));
    }

    const QStringList installed = QFontDatabase::families();

    if (family.isEmpty() && !style.fontFamily.isEmpty()) {
        if (installed.contains(style.fontFamily, Qt::CaseInsensitive))
            family = style.fontFamily;
        else
            m_logger.warning(QString("Font family \"%1\" is not installed, falling back")
                                 .arg(style.fontFamily));
    }

    if (family.isEmpty()) {
        for (const char* candidate : FallbackFamilies) {
            if (installed.contains(QString::fromLatin1(candidate), Qt::CaseInsensitive)) {
                family = QString::fromLatin1(candidate);
                break;
            }
        }
    }

    QFont font;
    if (family.isEmpty()) {
        font = QFontDatabase::systemFont(QFontDatabase::GeneralFont);
        m_logger.info(QString("Using system font %1 for name plates").arg(font.family()));
    } else {
        font = QFont(family);
    }

    font.setPixelSize(std::max(1, style.fontSize));
    font.setBold(true);
    return font;
}

QImage ImageCompositor::loadImage(const QString& filePath, QString* error) {
    QImageReader reader(filePath);
    reader.setAutoTransform(true);
    QImage image = reader.read();
    if (image.isNull()) {
        if (error)
            *error = QString("Cannot load image %1: %2").arg(filePath, reader.errorString());
        return QImage();
    }
    return image.convertToFormat(QImage::Format_RGB32);
}

QSize ImageCompositor::measureText(const QString& text) const {
    QFontMetrics fm(m_font);
    return fm.boundingRect(text).size();
}

QImage ImageCompositor::renderNamePlate(const QString& text, int minWidth) const {
    const int padding = m_style.platePadding;
    const QSize textSize = measureText(text);
    const int width = std::max(textSize.width() + 2 * padding, minWidth);
    const int height = std::max(textSize.height() + 2 * padding, AppConstants::NamePlateMinHeight);

    QImage plate(width, height, QImage::Format_ARGB32);
    plate.fill(Qt::transparent);

    QPainter painter(&plate);
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.fillRect(plate.rect(), m_style.plateBackground);

    // Border stroked inside the plate edge
    const int bw = std::min({ m_style.plateBorderWidth, width / 2, height / 2 });
    if (bw > 0) {
        const QColor& c = m_style.plateBorderColor;
        painter.fillRect(QRect(0, 0, width, bw), c);
        painter.fillRect(QRect(0, height - bw, width, bw), c);
        painter.fillRect(QRect(0, bw, bw, height - 2 * bw), c);
        painter.fillRect(QRect(width - bw, bw, bw, height - 2 * bw), c);
    }

    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.setFont(m_font);
    painter.setPen(m_style.fontColor);
    painter.drawText(plate.rect(), Qt::AlignCenter, text);
    painter.end();

    return plate;
}

bool ImageCompositor::overlay(QImage& background, const QImage& overlay, int x, int y,
                              double opacity) {
    if (overlay.isNull() || background.isNull()) return false;
    if (x < 0 || y < 0 ||
        x + overlay.width() > background.width() ||
        y + overlay.height() > background.height())
        return false;

    if (background.format() != QImage::Format_RGB32 && background.format() != QImage::Format_ARGB32)
        background = background.convertToFormat(QImage::Format_RGB32);
    const QImage src = overlay.format() == QImage::Format_ARGB32
        ? overlay : overlay.convertToFormat(QImage::Format_ARGB32);

    const double globalAlpha = qBound(0.0, opacity, 1.0);

    for (int row = 0; row < src.height(); ++row) {
        const QRgb* in = reinterpret_cast<const QRgb*>(src.constScanLine(row));
        QRgb* out = reinterpret_cast<QRgb*>(background.scanLine(y + row)) + x;
        for (int col = 0; col < src.width(); ++col) {
            const double a = qAlpha(in[col]) / 255.0 * globalAlpha;
            if (a <= 0.0) continue;
            const QRgb bg = out[col];
            const int r = qRound(a * qRed(in[col]) + (1.0 - a) * qRed(bg));
            const int g = qRound(a * qGreen(in[col]) + (1.0 - a) * qGreen(bg));
            const int b = qRound(a * qBlue(in[col]) + (1.0 - a) * qBlue(bg));
            out[col] = qRgba(r, g, b, qAlpha(bg));
        }
    }
    return true;
}
