#pragma once
#include <QString>

#include "link_engine.h"

enum class ConflictAction { Rename, Overwrite, Skip };

struct ConflictOutcome {
    enum class Kind {
        Linked,              // link created (with or without a prior conflict)
        Skipped,             // target existed and the strategy was skip
        UnsupportedStrategy,
        RemoveFailed,        // overwrite could not delete the existing target
        NoUniqueName,        // rename ran out of candidates
        LinkFailed           // see `link`
    };

    Kind kind = Kind::Linked;
    bool hadConflict = false;
    QString targetPath;  // path that was (or would have been) linked
    QString detail;
    LinkOutcome link;

    // Handled without error: linked or deliberately skipped.
    bool isOk() const { return kind == Kind::Linked || kind == Kind::Skipped; }
    QString message() const;
};

class ConflictResolver {
public:
    static constexpr int MAX_RENAME_ATTEMPTS = 100;

    explicit ConflictResolver(const LinkEngine& engine);

    // "skip", "overwrite" or "rename" (case-insensitive).
    static bool parseAction(const QString& name, ConflictAction* action);
    static QString actionName(ConflictAction action);

    ConflictOutcome resolve(const QString& source, const QString& target, const QString& strategy) const;
    ConflictOutcome resolve(const QString& source, const QString& target, ConflictAction action) const;

    // First free "name_N.ext" next to `target`, N = 1..MAX_RENAME_ATTEMPTS;
    // empty when every candidate is taken.
    static QString uniqueRenameTarget(const QString& target);

private:
    ConflictOutcome linkTo(const QString& source, const QString& target, bool hadConflict) const;

    const LinkEngine& m_engine;
};
