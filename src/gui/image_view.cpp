/*
 * src/gui/image_view.cpp - Picture display widget
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "image_view.h"
#include <QPalette>
#include <QPixmap>

namespace ahoview {

ImageView::ImageView(QWidget* parent)
    : QScrollArea(parent)
    , label_(new QLabel())
{
    label_->setAlignment(Qt::AlignCenter);
    label_->setBackgroundRole(QPalette::Dark);
    label_->setAutoFillBackground(true);

    setBackgroundRole(QPalette::Dark);
    setAlignment(Qt::AlignCenter);
    setWidgetResizable(true);
    setFrameShape(QFrame::NoFrame);
    setWidget(label_);

    clear(tr("Drop a folder here or use File > Open Directory..."));
}

void ImageView::setImage(const QImage& image) {
    label_->setPixmap(QPixmap::fromImage(image));
    label_->setMinimumSize(image.size());
}

void ImageView::clear(const QString& text) {
    label_->clear();
    label_->setMinimumSize(0, 0);
    label_->setText(text);
}

QSize ImageView::availableSize() const {
    return maximumViewportSize();
}

void ImageView::resizeEvent(QResizeEvent* event) {
    QScrollArea::resizeEvent(event);
    emit viewportResized();
}

void ImageView::wheelEvent(QWheelEvent* event) {
    // Ctrl+wheel keeps the default scrolling for oversized pictures
    if (event->modifiers() & Qt::ControlModifier) {
        QScrollArea::wheelEvent(event);
        return;
    }

    // One step per notch (120 units); touchpads deliver smaller deltas
    wheelAccumulator_ += event->angleDelta().y();
    while (wheelAccumulator_ >= 120) {
        wheelAccumulator_ -= 120;
        emit stepRequested(-1);
    }
    while (wheelAccumulator_ <= -120) {
        wheelAccumulator_ += 120;
        emit stepRequested(1);
    }
    event->accept();
}

} // namespace ahoview
