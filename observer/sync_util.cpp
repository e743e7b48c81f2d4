#include "sync_util.hpp"

size_t observer::sync_util::Tickets::locked_get_next_ticket() {
  size_t ticket = ++next_ticket;
  tickets.insert(ticket);
  return ticket;
}

bool observer::sync_util::Tickets::locked_find_ticket(size_t ticket) const {
  return tickets.find(ticket) != tickets.end();
}

void observer::sync_util::Tickets::locked_clear_ticket(size_t ticket) {
  tickets.erase(ticket);
}

std::shared_ptr<observer::sync_util::Tickets> observer::sync_util::tickets =
  std::make_shared<observer::sync_util::Tickets>();
