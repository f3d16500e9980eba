/*
 * Copyright(C) 2015-2016, The LiveUSB Creator developers
 *
 * This file is part of the LiveUSB Creator.
 *
 * The LiveUSB Creator is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 3 of the License, or (at your option) any
 * later version.
 *
 * The LiveUSB Creator is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License along with the
 * LiveUSB Creator. If not, see <http://www.gnu.org/licenses>.
 */

#ifndef LBLEVENT_HPP
#define LBLEVENT_HPP

#include <QMouseEvent>
#include <QLabel>

class lblevent : public QLabel
{
    Q_OBJECT

public:
    inline lblevent(QWidget *prnt) : QLabel(prnt), MousePressed(false) {}

protected:
    void mouseReleaseEvent(QMouseEvent *ev),
         mousePressEvent(QMouseEvent *ev),
         enterEvent(QEvent *),
         leaveEvent(QEvent *);

private:
    bool MousePressed;

signals:
    void Mouse_Click();
    void Mouse_Enter();
    void Mouse_Leave();
};

inline void lblevent::mousePressEvent(QMouseEvent *ev)
{
    if(ev->button() == Qt::LeftButton) MousePressed = true;
}

inline void lblevent::mouseReleaseEvent(QMouseEvent *ev)
{
    if(ev->button() == Qt::LeftButton && MousePressed)
    {
        MousePressed = false;
        if(rect().contains(ev->pos())) emit Mouse_Click();
    }
}

inline void lblevent::enterEvent(QEvent *)
{
    QFont fnt(font());
    fnt.setUnderline(true), setFont(fnt);
    emit Mouse_Enter();
}

inline void lblevent::leaveEvent(QEvent *)
{
    QFont fnt(font());
    fnt.setUnderline(false), setFont(fnt);
    emit Mouse_Leave();
}

#endif
