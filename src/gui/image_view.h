/*
 * src/gui/image_view.h - Scrollable label that displays the current picture
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#ifndef AHOVIEW_IMAGE_VIEW_H
#define AHOVIEW_IMAGE_VIEW_H

#include <QScrollArea>
#include <QLabel>
#include <QImage>
#include <QSize>
#include <QResizeEvent>
#include <QWheelEvent>

namespace ahoview {

class ImageView : public QScrollArea {
    Q_OBJECT

public:
    explicit ImageView(QWidget* parent = nullptr);

    void setImage(const QImage& image);
    void clear(const QString& text = QString());

    // Space available for the picture, not counting scroll bars
    QSize availableSize() const;

signals:
    void viewportResized();
    void stepRequested(int offset);

protected:
    void resizeEvent(QResizeEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    QLabel* label_;
    int wheelAccumulator_ = 0;
};

} // namespace ahoview

#endif // AHOVIEW_IMAGE_VIEW_H
