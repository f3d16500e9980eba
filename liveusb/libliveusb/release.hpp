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

#ifndef RELEASE_HPP
#define RELEASE_HPP

#include "catalogue.hpp"
#include "creator.hpp"
#include <QCryptographicHash>
#include <QAtomicInt>
#include <QDateTime>

class QNetworkAccessManager;
class QNetworkReply;
class release;
class lvdata;

class LU_EXPORT rdownload : public QObject
{
    Q_OBJECT
    Q_PROPERTY(qreal maxProgress READ maxProgress NOTIFY maximumChanged)
    Q_PROPERTY(qreal progress READ progress NOTIFY currentChanged)
    Q_PROPERTY(bool running READ running NOTIFY runningChanged)
    Q_PROPERTY(QString path READ path NOTIFY pathChanged)

public:
    rdownload(release *rls, creator *lv);
    ~rdownload();

    qreal maxProgress() const, progress() const;
    bool running() const;
    QStr path() const;

    void setpath(cQStr &value);

public slots:
    void run(),
         cancel();

signals:
    void runningChanged(),
         currentChanged(),
         maximumChanged(),
         pathChanged();

private:
    release *rls;
    creator *lv;
    QNetworkAccessManager *nam;
    QNetworkReply *rply;
    QFile *pfile;
    QCryptographicHash chash;
    QStr dpath, pth, sha;
    qreal max, cur;
    bool rng;

    void reset(),
         start(qreal size),
         update(qreal amount),
         end(),
         fail(cQStr &emsg),
         cleanup();

private slots:
    void received(),
         dfinished();
};

class LU_EXPORT wrthread : public QThread
{
    Q_OBJECT

public:
    explicit wrthread(creator *lv, QObject *prnt = nullptr);

    QStr img, dev;
    QAtomicInt kill;

signals:
    void wprogress(double value);
    void wdone(bool ok, const QString &emsg);

protected:
    void run();

private:
    creator *lv;
};

class LU_EXPORT rwriter : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool running READ running NOTIFY runningChanged)
    Q_PROPERTY(qreal progress READ progress NOTIFY currentChanged)
    Q_PROPERTY(QString status READ status NOTIFY statusChanged)
    Q_PROPERTY(bool finished READ finished WRITE setFinished NOTIFY finishedChanged)

public:
    rwriter(release *rls, creator *lv);
    ~rwriter();

    bool running() const, finished() const;
    qreal progress() const;
    QStr status() const;

    void setFinished(bool value);

public slots:
    void run(),
         cancel();

signals:
    void runningChanged(),
         currentChanged(),
         statusChanged(),
         finishedChanged();

private:
    release *rls;
    creator *lv;
    wrthread *wthrd;
    QStr sts;
    qreal cur;
    bool rng, fnshd, cncld;

    void reset(),
         setrunning(bool value),
         setstatus(cQStr &value);

private slots:
    void wprogress(double value),
         wdone(bool ok, const QString &emsg);
};

class LU_EXPORT release : public QObject
{
    Q_OBJECT
    Q_PROPERTY(int index READ index CONSTANT)
    Q_PROPERTY(bool isSeparator READ isSeparator CONSTANT)
    Q_PROPERTY(bool isLocal READ isLocal CONSTANT)
    Q_PROPERTY(QString name READ name CONSTANT)
    Q_PROPERTY(QString logo READ logo CONSTANT)
    Q_PROPERTY(QString version READ version CONSTANT)
    Q_PROPERTY(QDateTime releaseDate READ releaseDate CONSTANT)
    Q_PROPERTY(QString summary READ summary CONSTANT)
    Q_PROPERTY(QString description READ description CONSTANT)
    Q_PROPERTY(QString category READ category CONSTANT)
    Q_PROPERTY(QStringList arch READ arch CONSTANT)
    Q_PROPERTY(QStringList screenshots READ screenshots NOTIFY screenshotsChanged)
    Q_PROPERTY(QString url READ url NOTIFY urlChanged)
    Q_PROPERTY(qreal size READ size NOTIFY sizeChanged)
    Q_PROPERTY(QString path READ path WRITE setPath NOTIFY pathChanged)
    Q_PROPERTY(bool readyToWrite READ readyToWrite NOTIFY pathChanged)
    Q_PROPERTY(rdownload *download READ download CONSTANT)
    Q_PROPERTY(rwriter *writer READ writer CONSTANT)
    Q_PROPERTY(QString status READ status NOTIFY statusChanged)
    Q_PROPERTY(QStringList info READ info NOTIFY infoChanged)
    Q_PROPERTY(QStringList warning READ warning NOTIFY warningChanged)
    Q_PROPERTY(QStringList error READ error NOTIFY errorChanged)

public:
    release(lvdata *prnt, int idx, creator *lv, const rinfo &data);

    int index() const;
    bool isSeparator() const, isLocal() const, readyToWrite() const;
    qreal size() const;

    QStr name() const, logo() const, version() const, summary() const, description() const, category() const,
         url() const, filename() const, sha256() const, path() const, status() const;

    QSL arch() const, screenshots() const, info() const, warning() const, error() const;
    QDateTime releaseDate() const;
    rdownload *download() const;
    rwriter *writer() const;

    void setPath(QStr value),
         addInfo(cQStr &value),
         addWarning(cQStr &value),
         addError(cQStr &value);

    Q_INVOKABLE void get(),
                     write();

signals:
    void screenshotsChanged(),
         errorChanged(),
         warningChanged(),
         infoChanged(),
         statusChanged(),
         pathChanged(),
         sizeChanged(),
         urlChanged();

private:
    lvdata *lvd;
    creator *lv;
    rdownload *dl;
    rwriter *wr;
    rinfo dt;
    QSL inf, wrn, err;
    ullong sz;
    int idx;

    void setsize(ullong value);
    const rvariant *variant() const;
};

inline qreal rdownload::maxProgress() const
{
    return max;
}

inline qreal rdownload::progress() const
{
    return cur;
}

inline bool rdownload::running() const
{
    return rng;
}

inline QStr rdownload::path() const
{
    return pth;
}

inline bool rwriter::running() const
{
    return rng;
}

inline bool rwriter::finished() const
{
    return fnshd;
}

inline qreal rwriter::progress() const
{
    return cur;
}

inline QStr rwriter::status() const
{
    return sts;
}

inline int release::index() const
{
    return idx;
}

inline bool release::isSeparator() const
{
    return dt.source.isEmpty();
}

inline bool release::isLocal() const
{
    return dt.source == "Local";
}

inline bool release::readyToWrite() const
{
    return ! path().isEmpty();
}

inline QStr release::name() const
{
    return dt.name;
}

inline QStr release::logo() const
{
    return dt.logo;
}

inline QStr release::version() const
{
    return dt.version;
}

inline QStr release::summary() const
{
    return dt.summary;
}

inline QStr release::description() const
{
    return dt.description;
}

inline QStr release::path() const
{
    return dl->path();
}

inline QSL release::screenshots() const
{
    return dt.screenshots;
}

inline QSL release::info() const
{
    return inf;
}

inline QSL release::warning() const
{
    return wrn;
}

inline QSL release::error() const
{
    return err;
}

inline QDateTime release::releaseDate() const
{
    return QDateTime::fromString(dt.releaseDate, Qt::ISODate);
}

inline rdownload *release::download() const
{
    return dl;
}

inline rwriter *release::writer() const
{
    return wr;
}

#endif
