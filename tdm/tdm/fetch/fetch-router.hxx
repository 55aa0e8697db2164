#pragma once

#include <chrono>

#include <tdm/fetch/fetch-dispatcher.hxx>
#include <tdm/record/record-types.hxx>

namespace tdm
{
  // Route records to the dispatcher of their origin.
  //
  template <typename S, typename X, typename C = std::chrono::steady_clock>
  class basic_fetch_router
  {
  public:
    using direct_dispatcher =
      basic_fetch_dispatcher<direct_fetch_traits<S, X, C>>;

    using rule_dispatcher =
      basic_fetch_dispatcher<rule_fetch_traits<S, X, C>>;

    using source_type = typename direct_dispatcher::source_type;

    basic_fetch_router (direct_dispatcher& d, rule_dispatcher& r)
      : direct_ (d), rule_ (r)
    {
    }

    bool
    start (const download_record& r, source_type s)
    {
      switch (r.origin ())
      {
      case download_origin::direct: return direct_.start (r, std::move (s));
      case download_origin::rule:   return rule_.start (r, std::move (s));
      }
      return false;
    }

    bool
    restore (const download_record& r)
    {
      switch (r.origin ())
      {
      case download_origin::direct: return direct_.restore (r);
      case download_origin::rule:   return rule_.restore (r);
      }
      return false;
    }

    direct_dispatcher&
    direct () noexcept
    {
      return direct_;
    }

    rule_dispatcher&
    rule () noexcept
    {
      return rule_;
    }

  private:
    direct_dispatcher& direct_;
    rule_dispatcher& rule_;
  };
}
