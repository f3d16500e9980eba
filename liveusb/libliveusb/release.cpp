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

#include "release.hpp"
#include "rlmodel.hpp"
#include "lvdata.hpp"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QDir>
#include <QUrl>

rdownload::rdownload(release *rls, creator *lv) : QObject(rls), rls(rls), lv(lv), nam(nullptr), rply(nullptr), pfile(nullptr), chash(QCryptographicHash::Sha256), max(-1), cur(-1), rng(false) {}

rdownload::~rdownload()
{
    cleanup();
}

void rdownload::setpath(cQStr &value)
{
    if(pth != value)
    {
        pth = value;
        lv->setiso(value);
        emit pathChanged();
    }
}

void rdownload::reset()
{
    rng = false, cur = max = -1;
    setpath(nullptr);
    emit runningChanged();
    emit currentChanged();
    emit maximumChanged();
}

void rdownload::start(qreal size)
{
    max = size, rng = true;
    emit maximumChanged();
    emit runningChanged();
}

void rdownload::update(qreal amount)
{
    if(cur < amount)
    {
        cur = amount;
        emit currentChanged();
    }
}

void rdownload::end()
{
    cur = max;
    emit currentChanged();
    rng = false;
    emit runningChanged();
}

void rdownload::cleanup()
{
    if(rply)
    {
        QNetworkReply *crply(rply);
        rply = nullptr;
        crply->disconnect(this), crply->abort(), crply->deleteLater();
    }

    if(pfile)
    {
        pfile->close();
        if(pfile->exists() && ! pfile->remove()) lu::error("\n " % tr("An error occurred while removing the following file:") % "\n\n  " % pfile->fileName() % "\n\n", true);
        delete pfile, pfile = nullptr;
    }
}

void rdownload::fail(cQStr &emsg)
{
    cleanup(), reset();
    lu::log(lu::Err, emsg);
    rls->addError(emsg);
}

void rdownload::run()
{
    if(! rls->path().isEmpty() || rng) return;
    QStr url(rls->url());
    if(url.isEmpty()) return fail(tr("No image is available for the selected architecture."));
    QStr fname(rls->filename());
    if(fname.isEmpty() && (fname = QUrl(url).fileName()).isEmpty()) return fail(tr("Unable to determine the file name of the following image:") % ' ' % url);
    if(! lu::isdir(lu::dldir) && ! QDir().mkpath(lu::dldir)) return fail(tr("Unable to create the download directory:") % ' ' % lu::dldir);
    dpath = lu::dldir % '/' % fname;
    ullong esize(rls->size());

    if(esize && lu::isfile(dpath) && lu::fsize(dpath) == esize)
    {
        lu::log(lu::Info, tr("The image has already been downloaded:") % ' ' % dpath);
        start(esize), end(), reset();
        return setpath(dpath);
    }

    pfile = new QFile(dpath % ".part");

    if(! pfile->open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        delete pfile, pfile = nullptr;
        return fail(tr("Unable to create the following file:") % ' ' % dpath % ".part");
    }

    sha = rls->sha256();
    chash.reset();
    if(! nam) nam = new QNetworkAccessManager(this);
    QNetworkRequest rqst((QUrl(url)));
#if QT_VERSION >= QT_VERSION_CHECK(5, 6, 0)
    rqst.setAttribute(QNetworkRequest::FollowRedirectsAttribute, true);
#endif
    rply = nam->get(rqst);
    connect(rply, &QNetworkReply::readyRead, this, &rdownload::received);
    connect(rply, &QNetworkReply::finished, this, &rdownload::dfinished);

    connect(rply, &QNetworkReply::downloadProgress, this, [this](qint64 rcvd, qint64 total) {
            if(total > 0 && max != total)
            {
                max = total;
                emit maximumChanged();
            }

            update(rcvd);
        });

    lu::log(lu::Info, tr("Downloading the following image:") % ' ' % url);
    start(esize ? qreal(esize) : -1);
}

void rdownload::received()
{
    if(! (rply && pfile)) return;
    QBA data(rply->readAll());
    if(data.isEmpty()) return;
    chash.addData(data);
    if(pfile->write(data) != data.size()) fail(tr("An error occurred while writing the following file:") % ' ' % pfile->fileName());
}

void rdownload::dfinished()
{
    if(! rply) return;
    if(rply->error() != QNetworkReply::NoError) return fail(tr("An error occurred while downloading the image:") % ' ' % rply->errorString());
    received();
    if(! (rply && pfile)) return;

    {
        QNetworkReply *crply(rply);
        rply = nullptr;
        crply->deleteLater();
    }

    pfile->close();
    if(! sha.isEmpty() && chash.result().toHex() != sha.toLower().toLatin1()) return fail(tr("The checksum of the downloaded image does not match:") % ' ' % dpath);
    if((lu::isfile(dpath) && ! QFile::remove(dpath)) || ! pfile->rename(dpath)) return fail(tr("Unable to rename the following file:") % ' ' % pfile->fileName());
    delete pfile, pfile = nullptr;
    end();
    lu::log(lu::Info, tr("The download has finished:") % ' ' % dpath);
    reset(), setpath(dpath);
}

void rdownload::cancel()
{
    cleanup(), reset();
}

wrthread::wrthread(creator *lv, QObject *prnt) : QThread(prnt), kill(0), lv(lv) {}

void wrthread::run()
{
    QStr emsg;

    bool rv(lv->ddimage(img, dev, [this](double value) {
            emit wprogress(value);
            return ! kill.load();
        }, emsg));

    emit wdone(rv, emsg);
}

rwriter::rwriter(release *rls, creator *lv) : QObject(rls), rls(rls), lv(lv), wthrd(new wrthread(lv, this)), cur(-1), rng(false), fnshd(false), cncld(false)
{
    connect(wthrd, &wrthread::wprogress, this, &rwriter::wprogress);
    connect(wthrd, &wrthread::wdone, this, &rwriter::wdone);
}

rwriter::~rwriter()
{
    if(wthrd->isRunning()) wthrd->kill.store(1), wthrd->wait();
}

void rwriter::setrunning(bool value)
{
    if(rng != value)
    {
        rng = value;
        emit runningChanged();
    }
}

void rwriter::setstatus(cQStr &value)
{
    if(sts != value)
    {
        sts = value;
        emit statusChanged();
    }
}

void rwriter::setFinished(bool value)
{
    if(fnshd != value)
    {
        fnshd = value;
        emit finishedChanged();
    }
}

void rwriter::reset()
{
    setrunning(false);
    cur = -1;
    emit currentChanged();
}

void rwriter::run()
{
    if(rng || wthrd->isRunning()) return;
    if(lv->drive.isEmpty()) return rls->addError(tr("No USB drive is selected."));
    if(rls->path().isEmpty()) return rls->addError(tr("No image is selected."));
    cncld = false, cur = 0;
    setFinished(false), setrunning(true);
    emit currentChanged();
    setstatus(tr("Writing"));
    wthrd->img = rls->path(), wthrd->dev = lv->drive;
    wthrd->kill.store(0);
    lu::log(lu::Info, tr("Writing the image to the following drive:") % ' ' % wthrd->dev);
    wthrd->start();
}

void rwriter::cancel()
{
    if(wthrd->isRunning()) cncld = true, wthrd->kill.store(1);
    reset();
}

void rwriter::wprogress(double value)
{
    if(! cncld && cur != value)
    {
        cur = value;
        emit currentChanged();
    }
}

void rwriter::wdone(bool ok, const QString &emsg)
{
    if(cncld) return;

    if(ok)
    {
        setstatus(tr("Finished!")), setFinished(true);
        lu::log(lu::Info, tr("The image has been written to the following drive:") % ' ' % wthrd->dev);
    }
    else
    {
        QStr msg(emsg.isEmpty() ? tr("An error occurred while writing the image.") : emsg);
        lu::log(lu::Err, msg);
        rls->addError(msg);
    }

    setrunning(false);
}

release::release(lvdata *prnt, int idx, creator *lv, const rinfo &data) : QObject(prnt), lvd(prnt), lv(lv), dl(nullptr), wr(nullptr), dt(data), sz(0), idx(idx)
{
    addWarning(tr("You are about to perform a destructive install. This will erase all data and partitions on your USB drive"));
    dl = new rdownload(this, lv), wr = new rwriter(this, lv);
    connect(dl, &rdownload::pathChanged, this, &release::pathChanged);
    connect(this, &release::pathChanged, this, &release::statusChanged);
    connect(this, &release::errorChanged, this, &release::statusChanged);
    connect(dl, &rdownload::runningChanged, this, &release::statusChanged);
    connect(wr, &rwriter::runningChanged, this, &release::statusChanged);
    connect(wr, &rwriter::statusChanged, this, &release::statusChanged);
    connect(wr, &rwriter::finishedChanged, this, &release::statusChanged);
    connect(prnt->releaseProxyModel(), &rlproxy::archFilterChanged, this, &release::sizeChanged);
    connect(prnt->releaseProxyModel(), &rlproxy::archFilterChanged, this, &release::urlChanged);
}

const rvariant *release::variant() const
{
    if(isLocal()) return nullptr;
    QSL abbrs(rlproxy::archabbrs(lvd->releaseProxyModel()->archFilter()));

    for(QMap<QStr, rvariant>::const_iterator it(dt.variants.constBegin()) ; it != dt.variants.constEnd() ; ++it)
        if(abbrs.contains(it.key())) return &it.value();

    return nullptr;
}

qreal release::size() const
{
    const rvariant *vrnt(variant());
    return vrnt ? vrnt->size : sz;
}

void release::setsize(ullong value)
{
    if(isLocal() && sz != value)
    {
        sz = value;
        emit sizeChanged();
    }
}

QStr release::url() const
{
    const rvariant *vrnt(variant());
    return vrnt ? vrnt->url : nullptr;
}

QStr release::sha256() const
{
    const rvariant *vrnt(variant());
    return vrnt ? vrnt->sha256 : nullptr;
}

QStr release::filename() const
{
    QStr curl(url());
    return curl.contains(".iso") ? QUrl(curl).fileName() : dt.variants.value("x86_64").filename;
}

QSL release::arch() const
{
    QSL alst;

    for(cQStr &name : rlproxy::archnames())
        for(cQStr &abbr : rlproxy::archabbrs(name))
            if(dt.variants.contains(abbr))
            {
                alst.append(name);
                break;
            }

    return alst;
}

QStr release::category() const
{
    return lu::mcats.contains(dt.source) ? QStr("main")
        : dt.source == "Spins" ? lu::fmt(tr("<b>{DISTRO} Spins </b> &nbsp; Alternative desktops for {DISTRO}"))
        : dt.source == "Labs" ? lu::fmt(tr("<b>{DISTRO} Labs </b> &nbsp; Functional bundles for {DISTRO}"))
        : QStr("<b>Other</b>");
}

void release::setPath(QStr value)
{
    if(value.startsWith("file://")) value.remove(0, 7);

    if(dl->path() != value)
    {
        dl->setpath(value);
        setsize(lv->isosize);
    }
}

QStr release::status() const
{
    return ! (wr->finished() || dl->running() || readyToWrite() || wr->running() || ! err.isEmpty()) ? tr("Starting")
        : dl->running() ? tr("Downloading")
        : ! err.isEmpty() ? tr("Error")
        : readyToWrite() && ! wr->running() && ! wr->finished() ? tr("Ready to write")
        : ! wr->status().isEmpty() ? wr->status()
        : tr("Finished");
}

void release::addInfo(cQStr &value)
{
    if(! inf.contains(value))
    {
        inf.append(value);
        emit infoChanged();
    }
}

void release::addWarning(cQStr &value)
{
    if(! wrn.contains(value))
    {
        wrn.append(value);
        emit warningChanged();
    }
}

void release::addError(cQStr &value)
{
    if(! err.contains(value))
    {
        err.append(value);
        emit errorChanged();
    }
}

void release::get()
{
    if(path().isEmpty()) dl->run();
}

void release::write()
{
    inf.clear(), wrn.clear(), err.clear();
    emit infoChanged();
    emit errorChanged();
    emit warningChanged();
    addInfo(lu::fmt(tr("After you have tried or installed {DISTRO}, you can use {DISTRO} LiveUSB Creator to restore your flash drive to its factory settings.")));
    wr->run();
}
