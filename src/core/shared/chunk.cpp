#include "core/shared/chunk.h"
#include <QCryptographicHash>

namespace sv {

QString computeChunkHash(const QString& text)
{
    const QByteArray hash = QCryptographicHash::hash(
        text.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

} // namespace sv
