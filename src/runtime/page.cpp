#include "domshield/runtime/page.hpp"

namespace domshield::runtime {

Page::Page(std::shared_ptr<dom::Document> document, const Clock &clock, PageOptions options)
    : document_(std::move(document)), clock_(clock), loop_(clock),
      idle_(loop_, options.idle_supported), url_(std::move(options.url)) {
  if (!document_) {
    document_ = dom::Document::create();
  }
  document_->set_mutation_delivery_hook([this]() {
    loop_.post([this]() { document_->flush_mutations(); });
  });
}

Page::~Page() { document_->set_mutation_delivery_hook(nullptr); }

bool Page::claim_init_token(const std::string &name) {
  return init_tokens_.insert(name).second;
}

bool Page::has_init_token(const std::string &name) const { return init_tokens_.contains(name); }

std::size_t Page::pump() { return loop_.run_pending(); }

} // namespace domshield::runtime
