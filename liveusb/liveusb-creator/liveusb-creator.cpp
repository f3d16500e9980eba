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

#include "ui_liveusb-creator.h"
#include "liveusb-creator.hpp"
#include "rlistdelegate.hpp"
#include <QGraphicsOpacityEffect>
#include <QPropertyAnimation>
#include <QMessageBox>
#include <QFileDialog>
#include <QCloseEvent>
#include <QDir>

liveusbcreator::liveusbcreator(lvdata *lvd) : QMainWindow(nullptr), ui(new Ui::liveusbcreator), lvd(lvd), prxy(lvd->releaseProxyModel()), blck(false)
{
    ui->setupUi(this);
    setWindowTitle(lu::fmt(tr("{DISTRO} LiveUSB Creator")));
    ui->restorebanner->hide(), ui->restorebanner->setBackgroundRole(QPalette::Highlight), ui->restorebanner->setForegroundRole(QPalette::HighlightedText), ui->restorebanner->setCursor(Qt::PointingHandCursor);
    ui->imagelist->setModel(prxy), ui->imagelist->setItemDelegate(new rlistdelegate(ui->imagelist));
    ui->archselect->addItems(prxy->possibleArchs()), ui->archselect->setCurrentText(prxy->archFilter());
    ui->allimages->setChecked(! prxy->isFront());
    ui->errortext->setStyleSheet("color: red"), ui->warningtext->setStyleSheet("color: darkorange");
    if(getuid()) lu::log(lu::Warn, tr("Root privileges are required for writing and restoring drives."));

    lu::logcb = [this](uchar, cQStr &txt) {
            QMetaObject::invokeMethod(this, "showlog", Qt::QueuedConnection, Q_ARG(QString, txt));
        };

    connect(ui->searchfield, &QLineEdit::textChanged, prxy, &rlproxy::setNameFilter),
    connect(ui->archselect, &QComboBox::currentTextChanged, prxy, &rlproxy::setArchFilter),
    connect(prxy, &rlproxy::archFilterChanged, this, &liveusbcreator::archchanged),
    connect(ui->allimages, &QPushButton::toggled, [this](bool chckd) { prxy->setIsFront(! chckd); }),
    connect(prxy, &rlproxy::isFrontChanged, [this] { ui->allimages->setChecked(! prxy->isFront()); }),
    connect(ui->imagelist, &QListView::clicked, this, &liveusbcreator::imgselected),
    connect(ui->back, &QPushButton::clicked, [this] { ui->pages->setCurrentIndex(0); }),
    connect(ui->choosefile, &QPushButton::clicked, this, &liveusbcreator::choose),
    connect(ui->download, &QPushButton::clicked, [this] { if(crls) crls->get(); }),
    connect(ui->write, &QPushButton::clicked, [this] { if(crls) crls->write(); }),
    connect(ui->cancel, &QPushButton::clicked, this, &liveusbcreator::cancel),
    connect(ui->restorebanner, &lblevent::Mouse_Click, this, &liveusbcreator::rstrclicked),
    connect(ui->driveselect, static_cast<void (QComboBox::*)(int)>(&QComboBox::currentIndexChanged), [this](int idx) { if(! blck && idx > -1) lvd->setCurrentDrive(idx); }),
    connect(lvd, &lvdata::usbDrivesChanged, this, &liveusbcreator::drvschanged),
    connect(lvd, &lvdata::currentDriveChanged, this, &liveusbcreator::drvschanged),
    connect(lvd, &lvdata::driveToRestoreChanged, this, &liveusbcreator::rstrchanged),
    connect(lvd, &lvdata::currentImageChanged, this, &liveusbcreator::imgchanged),
    connect(lvd, &lvdata::updateThreadStopped, this, &liveusbcreator::updstopped);

    if(lu::updrel == lu::True)
    {
        QGraphicsOpacityEffect *oeffect(new QGraphicsOpacityEffect(ui->updatenote));
        ui->updatenote->setGraphicsEffect(oeffect);
        QPropertyAnimation *anim(new QPropertyAnimation(oeffect, "opacity", ui->updatenote));
        anim->setDuration(600), anim->setStartValue(0.0), anim->setEndValue(1.0), anim->start(QAbstractAnimation::DeleteWhenStopped);
    }
    else
        ui->updatenote->hide();

    drvschanged(), rstrchanged(), imgchanged();
}

liveusbcreator::~liveusbcreator()
{
    lu::logcb = nullptr;
    delete ui;
}

bool liveusbcreator::busy()
{
    for(release *rls : lvd->releases())
        if(rls->download()->running() || rls->writer()->running()) return true;

    return false;
}

void liveusbcreator::closeEvent(QCloseEvent *ev)
{
    if(busy() && QMessageBox::question(this, windowTitle(), tr("A download or a write is in progress. Do you really want to quit?"), QMessageBox::Yes | QMessageBox::No, QMessageBox::No) != QMessageBox::Yes)
        return ev->ignore();

    for(release *rls : lvd->releases())
    {
        if(rls->download()->running()) rls->download()->cancel();
        if(rls->writer()->running()) rls->writer()->cancel();
    }

    ev->accept();
}

void liveusbcreator::showlog(const QString &txt)
{
    statusBar()->showMessage(txt, 10000);
}

void liveusbcreator::updstopped()
{
    ui->updatenote->hide();
}

void liveusbcreator::archchanged()
{
    if(ui->archselect->currentText() != prxy->archFilter()) ui->archselect->setCurrentText(prxy->archFilter());
    rlsupdate();
}

void liveusbcreator::imgselected(const QModelIndex &idx)
{
    release *rls(idx.data(rlmodel::Releaserole).value<release *>());
    if(! rls || rls->isSeparator()) return;
    lvd->setCurrentIndex(rls->index());
    if(crls != rls) imgchanged();
    ui->pages->setCurrentIndex(1);
}

void liveusbcreator::imgchanged()
{
    for(const QMetaObject::Connection &cnct : rcncts) disconnect(cnct);
    rcncts.clear();

    if((crls = lvd->currentImage()))
    {
        for(auto sgnl : {&release::statusChanged, &release::pathChanged, &release::sizeChanged, &release::infoChanged, &release::warningChanged, &release::errorChanged})
            rcncts.append(connect(crls.data(), sgnl, this, &liveusbcreator::rlsupdate));

        for(auto sgnl : {&rdownload::currentChanged, &rdownload::maximumChanged, &rdownload::runningChanged})
            rcncts.append(connect(crls->download(), sgnl, this, &liveusbcreator::rlsupdate));

        for(auto sgnl : {&rwriter::currentChanged, &rwriter::runningChanged})
            rcncts.append(connect(crls->writer(), sgnl, this, &liveusbcreator::rlsupdate));
    }
    else if(ui->pages->currentIndex())
        ui->pages->setCurrentIndex(0);

    rlsupdate();
}

void liveusbcreator::rlsupdate()
{
    if(! crls) return;
    rdownload *dl(crls->download());
    rwriter *wr(crls->writer());
    ui->imagename->setText("<b>" % crls->name().toHtmlEscaped() % "</b>"),
    ui->imageversion->setText(crls->version()),
    ui->imagesummary->setText(crls->summary()),
    ui->imagedescription->setText(crls->description()),
    ui->imagearch->setText(crls->isLocal() ? nullptr : prxy->archFilterDetailed()),
    ui->imagesize->setText(crls->size() > 0 ? QStr(tr("Size:") % ' ' % lu::hunit(crls->size())) : nullptr),
    ui->imagepath->setText(crls->path()),
    ui->choosefile->setVisible(crls->isLocal()),
    ui->status->setText(crls->status()),
    ui->infotext->setText(crls->info().join('\n')),
    ui->warningtext->setText(crls->warning().join('\n')),
    ui->errortext->setText(crls->error().join('\n'));

    if(dl->running())
    {
        if(dl->maxProgress() > 0)
            ui->progress->setMaximum(1000), ui->progress->setValue(qRound(qMax(dl->progress(), 0.0) * 1000 / dl->maxProgress()));
        else
            ui->progress->setMaximum(0);
    }
    else
        ui->progress->setMaximum(1000), ui->progress->setValue(wr->running() || wr->finished() ? qRound(qMax(wr->progress(), 0.0) * 1000) : crls->readyToWrite() ? 1000 : 0);

    ui->download->setVisible(! crls->isLocal()),
    ui->download->setEnabled(! (crls->readyToWrite() || dl->running())),
    ui->write->setEnabled(crls->readyToWrite() && ! wr->running() && lvd->currentDrive() > -1),
    ui->cancel->setEnabled(dl->running() || wr->running()),
    ui->driveselect->setEnabled(! wr->running()),
    ui->back->setEnabled(! wr->running());
}

void liveusbcreator::drvschanged()
{
    blck = true;

    if(ui->driveselect->count() != lvd->usbDriveNames().count() || [this] {
            for(int a(0) ; a < ui->driveselect->count() ; ++a)
                if(ui->driveselect->itemText(a) != lvd->usbDriveNames().at(a)) return true;

            return false;
        }())
    {
        ui->driveselect->clear(), ui->driveselect->addItems(lvd->usbDriveNames());
        if(lvd->usbDriveNames().isEmpty()) ui->driveselect->addItem(tr("There are no portable devices connected"));
    }

    ui->driveselect->setCurrentIndex(qMax(lvd->currentDrive(), 0)),
    blck = false;
    rlsupdate();
}

void liveusbcreator::rstrchanged()
{
    if(crstr) crstr->disconnect(this);

    if((crstr = lvd->driveToRestore()))
    {
        auto rtext([this] {
                ui->restorebanner->setText(crstr->beingRestored() ? tr("Restoring %1...").arg(crstr->text()) : tr("The drive %1 contains a live system. Click here to restore it to its factory settings.").arg(crstr->text())),
                ui->restorebanner->setEnabled(! crstr->beingRestored());
            });

        connect(crstr.data(), &usbdrive::beingRestoredChanged, this, rtext);
        rtext(), ui->restorebanner->show();
    }
    else
        ui->restorebanner->hide();
}

void liveusbcreator::rstrclicked()
{
    if(crstr && ! crstr->beingRestored() && QMessageBox::question(this, tr("Restore drive"), tr("To reclaim all space available on the drive, it has to be restored to its factory settings. The live system and all saved data will be deleted.") % "\n\n" % tr("Do you want to continue?"), QMessageBox::Yes | QMessageBox::No, QMessageBox::No) == QMessageBox::Yes)
        crstr->restore();
}

void liveusbcreator::choose()
{
    if(! crls) return;
    QStr path(QFileDialog::getOpenFileName(this, tr("Select an image"), lu::isdir(lu::dldir) ? lu::dldir : QDir::homePath(), tr("Image files (*.iso *.img *.raw)") % ";;" % tr("All files (*)")));
    if(! path.isEmpty()) crls->setPath(path);
}

void liveusbcreator::cancel()
{
    if(! crls) return;

    if(crls->download()->running())
        crls->download()->cancel();
    else if(crls->writer()->running())
        crls->writer()->cancel();
}
