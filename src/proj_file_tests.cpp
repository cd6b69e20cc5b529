#include "proj_file.h"

#include "errors.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <string>

using dotres::proj_file_parse_assembly_name;

TEST_CASE("proj_file: no AssemblyName") {
  CHECK(proj_file_parse_assembly_name("<Project></Project>") == "");
  CHECK(proj_file_parse_assembly_name("<Project/>") == "");
  CHECK(proj_file_parse_assembly_name(R"(<Project Sdk="Microsoft.NET.Sdk">
  <PropertyGroup>
    <OutputType>Exe</OutputType>
    <TargetFramework>netcoreapp2.0</TargetFramework>
  </PropertyGroup>
</Project>)") == "");
}

TEST_CASE("proj_file: AssemblyName in PropertyGroup") {
  CHECK(proj_file_parse_assembly_name(R"(
<Project Sdk="Microsoft.NET.Sdk.Web">
	<PropertyGroup>
		<AssemblyName>f.red.csproj</AssemblyName>
	</PropertyGroup>
</Project>)") == "f.red.csproj");
}

TEST_CASE("proj_file: declaration, BOM, comments and entities") {
  std::string const xml{ "\xEF\xBB\xBF<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                         "<!-- generated -->\n"
                         "<Project ToolsVersion='15.0'>\n"
                         "  <ItemGroup><None Include=\"a&amp;b\" /></ItemGroup>\n"
                         "  <PropertyGroup Condition=\" '$(Configuration)' == '' \">\n"
                         "    <AssemblyName> Tom&amp;Jerry&#46;Api </AssemblyName>\n"
                         "  </PropertyGroup>\n"
                         "</Project>\n" };
  CHECK(proj_file_parse_assembly_name(xml) == "Tom&Jerry.Api");
}

TEST_CASE("proj_file: last PropertyGroup setting wins") {
  CHECK(proj_file_parse_assembly_name("<Project>"
                                      "<PropertyGroup><AssemblyName>one</AssemblyName>"
                                      "</PropertyGroup>"
                                      "<PropertyGroup><OutputType>Exe</OutputType>"
                                      "</PropertyGroup>"
                                      "<PropertyGroup><AssemblyName>two</AssemblyName>"
                                      "</PropertyGroup>"
                                      "</Project>") == "two");
}

TEST_CASE("proj_file: nested AssemblyName elements are ignored") {
  CHECK(proj_file_parse_assembly_name("<Project><Target><PropertyGroup>"
                                      "<AssemblyName>inner</AssemblyName>"
                                      "</PropertyGroup></Target></Project>") == "");
  CHECK(proj_file_parse_assembly_name("<Project><AssemblyName>loose</AssemblyName>"
                                      "</Project>") == "");
}

TEST_CASE("proj_file: non-ASCII element names") {
  CHECK(proj_file_parse_assembly_name(
            "<Project><PropertyGroup><Beschreibung\xc3\xbc>x</Beschreibung\xc3\xbc>"
            "<AssemblyName>app</AssemblyName></PropertyGroup></Project>") == "app");
  CHECK(proj_file_parse_assembly_name(
            "<Project><PropertyGroup \xe5\x90\x8d=\"v\"><AssemblyName>\xc3\xa9t\xc3\xa9"
            "</AssemblyName></PropertyGroup></Project>") == "\xc3\xa9t\xc3\xa9");
}

TEST_CASE("proj_file: CDATA content") {
  CHECK(proj_file_parse_assembly_name("<Project><PropertyGroup><AssemblyName>"
                                      "<![CDATA[a<b]]></AssemblyName>"
                                      "</PropertyGroup></Project>") == "a<b");
}

TEST_CASE("proj_file: malformed documents") {
  SUBCASE("empty") {
    CHECK_THROWS_AS(proj_file_parse_assembly_name(""), dotres::malformed_descriptor_error);
  }
  SUBCASE("not xml") {
    CHECK_THROWS_AS(proj_file_parse_assembly_name("AssemblyName = foo"),
                    dotres::malformed_descriptor_error);
  }
  SUBCASE("unclosed root") {
    CHECK_THROWS_AS(proj_file_parse_assembly_name("<Project><PropertyGroup>"),
                    dotres::malformed_descriptor_error);
  }
  SUBCASE("mismatched end tag") {
    CHECK_THROWS_AS(
        proj_file_parse_assembly_name("<Project><PropertyGroup></Project></PropertyGroup>"),
        dotres::malformed_descriptor_error);
  }
  SUBCASE("unquoted attribute") {
    CHECK_THROWS_AS(proj_file_parse_assembly_name("<Project Sdk=Web></Project>"),
                    dotres::malformed_descriptor_error);
  }
  SUBCASE("unknown entity") {
    CHECK_THROWS_AS(proj_file_parse_assembly_name("<Project>&nbsp;</Project>"),
                    dotres::malformed_descriptor_error);
  }
}

TEST_CASE("proj_file_assembly_name: error names the file") {
  auto const path{ std::filesystem::temp_directory_path() / "dotres-proj-file-test.csproj" };
  {
    std::ofstream out{ path };
    out << "<Project>";
  }

  CHECK_THROWS_WITH_AS(dotres::proj_file_assembly_name(path),
                       doctest::Contains("dotres-proj-file-test.csproj"),
                       dotres::malformed_descriptor_error);

  std::error_code ec;
  std::filesystem::remove(path, ec);
}
