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

#ifndef LIVEUSBCREATOR_HPP
#define LIVEUSBCREATOR_HPP

#include "../libliveusb/lvdata.hpp"
#include <QMainWindow>
#include <QPointer>

namespace Ui {
class liveusbcreator;
}

class liveusbcreator : public QMainWindow
{
    Q_OBJECT

public:
    explicit liveusbcreator(lvdata *lvd);
    ~liveusbcreator();

protected:
    void closeEvent(QCloseEvent *ev);

private:
    Ui::liveusbcreator *ui;
    lvdata *lvd;
    rlproxy *prxy;
    QPointer<release> crls;
    QPointer<usbdrive> crstr;
    QList<QMetaObject::Connection> rcncts;
    bool blck;

    bool busy();

private slots:
    void imgselected(const QModelIndex &idx);
    void showlog(const QString &txt);
    void drvschanged();
    void rstrchanged();
    void rstrclicked();
    void archchanged();
    void updstopped();
    void imgchanged();
    void rlsupdate();
    void choose();
    void cancel();
};

#endif
