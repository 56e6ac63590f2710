#include "sprite/load_observer.hpp"

#include "sprite/sprite_player.hpp"

namespace flipbook::sprite {

void LoadObserver::expect(const SpritePlayer& player) {
    awaiting_ = true;
    seen_revision_ = player.sheet_revision();
}

LoadObserver::Event LoadObserver::observe(const SpritePlayer& player) {
    if (!awaiting_) {
        return Event::None;
    }
    switch (player.load_state()) {
        case SpritePlayer::LoadState::Loaded:
            if (player.sheet_revision() == seen_revision_) {
                return Event::None;
            }
            seen_revision_ = player.sheet_revision();
            awaiting_ = false;
            return Event::Arrived;
        case SpritePlayer::LoadState::Failed:
            awaiting_ = false;
            return Event::Failed;
        case SpritePlayer::LoadState::Empty:
        case SpritePlayer::LoadState::Pending:
            break;
    }
    return Event::None;
}

}
