namespace restep
{
  // basic_path_template
  //

  template <typename S>
  inline std::size_t basic_path_template<S>::
  placeholder_count () const noexcept
  {
    std::size_t n (0);
    for (const segment_type& s: segments)
    {
      if (s.placeholder ())
        ++n;
    }
    return n;
  }

  template <typename S>
  inline std::vector<typename basic_path_template<S>::string_type>
  basic_path_template<S>::
  placeholder_names () const
  {
    std::vector<string_type> r;
    for (const segment_type& s: segments)
    {
      if (s.placeholder ())
        r.push_back (s.text);
    }
    return r;
  }

  template <typename S>
  inline typename basic_path_template<S>::string_type
  basic_path_template<S>::
  string (const delimiters& d) const
  {
    string_type r;
    for (const segment_type& s: segments)
    {
      if (s.placeholder ())
      {
        r += d.open;
        r += s.text;
        r += d.close;
      }
      else
        r += s.text;
    }
    return r;
  }
}
